// Copyright 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Writes submitted source code to uniquely named files for the recipes.

#ifndef CODEBOX_RUNNER_STAGING_H_
#define CODEBOX_RUNNER_STAGING_H_

#include <string>

#include "absl/random/bit_gen_ref.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace codebox {

// Returns a random RFC 4122 version 4 UUID in its canonical lowercase
// 8-4-4-4-12 form.
std::string GenerateUuid(absl::BitGenRef gen);
std::string GenerateUuid();

// Writes code to <dir>/<id><extension> and returns that path.
absl::StatusOr<std::string> StageSource(absl::string_view dir,
                                        absl::string_view id,
                                        absl::string_view extension,
                                        absl::string_view code);

// Removes a staged file. Missing files are not an error.
void RemoveStaged(const std::string& path);

}  // namespace codebox

#endif  // CODEBOX_RUNNER_STAGING_H_

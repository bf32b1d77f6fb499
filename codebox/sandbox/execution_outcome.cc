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

#include "codebox/sandbox/execution_outcome.h"

#include <ostream>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/escaping.h"

namespace codebox {

std::string ExecutionOutcome::ToString() const {
  return absl::StrCat(ok_ ? "Success" : "Failure", "(\"",
                      absl::CHexEscape(output_), "\")");
}

std::ostream& operator<<(std::ostream& os, const ExecutionOutcome& outcome) {
  return os << outcome.ToString();
}

}  // namespace codebox

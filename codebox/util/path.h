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

#ifndef CODEBOX_UTIL_PATH_H_
#define CODEBOX_UTIL_PATH_H_

#include <initializer_list>
#include <string>

#include "absl/strings/string_view.h"

namespace codebox::file {

std::string JoinPathList(std::initializer_list<absl::string_view> parts);

// Joins path components with exactly one "/" between them, skipping empty
// ones: JoinPath("/sys/fs/cgroup/", "sandbox_42") is
// "/sys/fs/cgroup/sandbox_42".
template <typename... T>
std::string JoinPath(const T&... parts) {
  return JoinPathList({absl::string_view(parts)...});
}

}  // namespace codebox::file

#endif  // CODEBOX_UTIL_PATH_H_

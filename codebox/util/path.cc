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

#include "codebox/util/path.h"

#include <initializer_list>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace codebox::file {

std::string JoinPathList(std::initializer_list<absl::string_view> parts) {
  std::string path;
  for (absl::string_view part : parts) {
    if (part.empty()) {
      continue;
    }
    if (!path.empty()) {
      absl::ConsumePrefix(&part, "/");
      if (path.back() != '/') {
        path.push_back('/');
      }
    }
    path.append(part.data(), part.size());
  }
  return path;
}

}  // namespace codebox::file

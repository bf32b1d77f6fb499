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

#ifndef CODEBOX_TESTING_H_
#define CODEBOX_TESTING_H_

#include <string>

#include "gmock/gmock.h"                     // IWYU pragma: keep
#include "gtest/gtest.h"                     // IWYU pragma: keep
#include "absl/strings/string_view.h"
#include "codebox/config.h"                  // IWYU pragma: export
#include "codebox/util/status_matchers.h"    // IWYU pragma: export

// Skips the current test unless the process may create user namespaces and
// write to the cgroup hierarchy, which most sandboxed CI runners forbid.
#define CODEBOX_SKIP_WITHOUT_ISOLATION_PRIVILEGES             \
  do {                                                        \
    if (!::codebox::HasIsolationPrivileges()) {               \
      GTEST_SKIP() << "Needs root for namespaces and cgroups"; \
    }                                                         \
  } while (0)

namespace codebox {

// Returns a writable path usable in tests. If the name argument is specified,
// returns a name under that path. This can then be used for creating temporary
// test files and/or directories.
std::string GetTestTempPath(absl::string_view name = {});

// Whether the current process runs with an effective uid of 0.
bool HasIsolationPrivileges();

}  // namespace codebox

#endif  // CODEBOX_TESTING_H_

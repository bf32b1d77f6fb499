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

#include "codebox/testing.h"

#include <unistd.h>

#include <cstdlib>

#include "absl/strings/string_view.h"
#include "codebox/util/path.h"

namespace codebox {

std::string GetTestTempPath(absl::string_view name) {
  // Bazel sets TEST_TMPDIR, under CTest fall back to the GoogleTest default.
  const char* test_tmpdir = getenv("TEST_TMPDIR");
  return file::JoinPath(test_tmpdir ? std::string(test_tmpdir)
                                    : ::testing::TempDir(),
                        name);
}

bool HasIsolationPrivileges() { return geteuid() == 0; }

}  // namespace codebox

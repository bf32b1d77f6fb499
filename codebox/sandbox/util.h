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

// Process helpers shared by the sandbox handle and the command injector.

#ifndef CODEBOX_SANDBOX_UTIL_H_
#define CODEBOX_SANDBOX_UTIL_H_

#include <sys/types.h>

#include <string>
#include <vector>

#include "absl/status/statusor.h"

namespace codebox::util {

// Holds a NULL-terminated char* array view of a vector of strings, suitable
// for the argv and envp parameters of the exec family.
class CharPtrArray {
 public:
  static CharPtrArray FromStringVector(const std::vector<std::string>& vec);

  const std::vector<const char*>& array() const { return array_; }

  const char* const* data() const { return array_.data(); }

 private:
  explicit CharPtrArray(const std::vector<std::string>& vec);

  const std::string content_;
  std::vector<const char*> array_;
};

// Returns the environment of the current process as KEY=VALUE strings.
std::vector<std::string> CurrentEnvironment();

struct CommunicateResult {
  // Raw waitpid() status, inspect with WIFEXITED() and friends.
  int wait_status = 0;
  std::string stdout_output;
  std::string stderr_output;
};

// Executes the program given by argv (looked up in PATH) with the specified
// environment, waits for it and returns what it wrote to stdout and stderr.
// No shell is involved. Returns an error if the program could not be spawned.
absl::StatusOr<CommunicateResult> Communicate(
    const std::vector<std::string>& argv, const std::vector<std::string>& envv);

// Returns the path of the /proc status entry of pid.
std::string GetProcStatusPath(pid_t pid);

// Returns the name of a RLIMIT_* resource.
std::string GetRlimitName(int resource);

// Returns signal description.
std::string GetSignalName(int signo);

}  // namespace codebox::util

#endif  // CODEBOX_SANDBOX_UTIL_H_

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

#include "codebox/sandbox/command_injector.h"

#include <sys/wait.h>

#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "codebox/sandbox/execution_outcome.h"
#include "codebox/sandbox/util.h"

namespace codebox {

std::vector<std::string> BuildInjectionCommand(pid_t pid,
                                               absl::string_view cmd,
                                               const InjectorOptions& options) {
  return {options.nsenter_binary,
          "--target",
          absl::StrCat(pid),
          "--pid",
          "--",
          options.shell,
          "-c",
          std::string(cmd)};
}

ExecutionOutcome RunCapturing(const std::vector<std::string>& argv) {
  VLOG(1) << "Running: " << absl::StrJoin(argv, " ");
  absl::StatusOr<util::CommunicateResult> result =
      util::Communicate(argv, util::CurrentEnvironment());
  if (!result.ok()) {
    LOG(WARNING) << "Could not run command: " << result.status();
    return ExecutionOutcome::Failure(std::string(result.status().message()));
  }

  const int status = result->wait_status;
  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    return ExecutionOutcome::Success(
        std::string(absl::StripTrailingAsciiWhitespace(result->stdout_output)));
  }
  if (WIFSIGNALED(status)) {
    VLOG(1) << "Command killed by " << util::GetSignalName(WTERMSIG(status));
  } else {
    VLOG(1) << "Command exited with " << WEXITSTATUS(status);
  }
  return ExecutionOutcome::Failure(
      std::string(absl::StripTrailingAsciiWhitespace(result->stderr_output)));
}

ExecutionOutcome InjectCommand(pid_t pid, absl::string_view cmd,
                               const InjectorOptions& options) {
  return RunCapturing(BuildInjectionCommand(pid, cmd, options));
}

}  // namespace codebox

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

#include "codebox/sandbox/termination.h"

#include <signal.h>
#include <sys/wait.h>

#include <cerrno>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace codebox {

int OsProcessControl::Kill(pid_t pid, int sig) { return kill(pid, sig); }

int OsProcessControl::WaitPid(pid_t pid, int* status, int flags) {
  return TEMP_FAILURE_RETRY(waitpid(pid, status, flags));
}

void OsProcessControl::SleepFor(absl::Duration duration) {
  absl::SleepFor(duration);
}

absl::Status TerminateProcess(pid_t pid, ProcessControl& control,
                              const TerminationPolicy& policy) {
  if (control.Kill(pid, SIGTERM) == -1) {
    if (errno == ESRCH) {
      VLOG(1) << "Process " << pid << " already gone";
      return absl::OkStatus();
    }
    return absl::ErrnoToStatus(errno, absl::StrCat("kill(", pid, ", SIGTERM)"));
  }

  for (int poll = 0; poll < policy.max_polls; ++poll) {
    int status = 0;
    // Errors are not fatal here: the process might not be our child, in which
    // case the remaining polls merely pace the grace period.
    if (control.WaitPid(pid, &status, WNOHANG) == pid &&
        (WIFEXITED(status) || WIFSIGNALED(status))) {
      VLOG(1) << "Process " << pid << " exited gracefully";
      return absl::OkStatus();
    }
    control.SleepFor(policy.poll_interval);
  }
  LOG(WARNING) << "Process " << pid << " still running after "
               << policy.max_polls << " polls, leaving it behind";
  return absl::DeadlineExceededError(
      absl::StrCat("Process ", pid, " did not exit after SIGTERM"));
}

}  // namespace codebox

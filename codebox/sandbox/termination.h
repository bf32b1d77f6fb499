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

// Bounded, non-escalating shutdown of a sandbox anchor.

#ifndef CODEBOX_SANDBOX_TERMINATION_H_
#define CODEBOX_SANDBOX_TERMINATION_H_

#include <sys/types.h>

#include "absl/status/status.h"
#include "absl/time/time.h"

namespace codebox {

// Interface for the process syscalls of the termination protocol, to allow
// mocking them in tests. Return values and errno follow kill(2) and
// waitpid(2).
class ProcessControl {
 public:
  virtual ~ProcessControl() = default;

  virtual int Kill(pid_t pid, int sig) = 0;
  virtual int WaitPid(pid_t pid, int* status, int flags) = 0;
  virtual void SleepFor(absl::Duration duration) = 0;
};

class OsProcessControl : public ProcessControl {
 public:
  int Kill(pid_t pid, int sig) override;
  int WaitPid(pid_t pid, int* status, int flags) override;
  void SleepFor(absl::Duration duration) override;
};

struct TerminationPolicy {
  int max_polls = 5;
  absl::Duration poll_interval = absl::Seconds(1);
};

// Sends SIGTERM to pid once, then polls waitpid(WNOHANG) up to
// policy.max_polls times, sleeping policy.poll_interval after every poll that
// did not observe an exit. Never sends SIGKILL.
//
// Returns OK once the process was seen exiting or being killed, and also if it
// no longer exists when the signal is sent. Returns the kill() error if the
// signal could not be delivered, and DeadlineExceededError if the process
// outlived the grace period.
absl::Status TerminateProcess(pid_t pid, ProcessControl& control,
                              const TerminationPolicy& policy = {});

}  // namespace codebox

#endif  // CODEBOX_SANDBOX_TERMINATION_H_

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

#include "codebox/sandbox/anchor.h"

#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "codebox/sandbox/isolation.h"
#include "codebox/sandbox/limits.h"
#include "codebox/util/raw_logging.h"

namespace codebox {
namespace {

// Closes every descriptor above stderr. Another thread of the parent may be
// holding pipe ends open at fork() time, the anchor must not keep them alive.
// Works without /proc.
void CloseInheritedFds() {
#ifdef __NR_close_range
  if (syscall(__NR_close_range, STDERR_FILENO + 1, ~0U, 0) == 0) {
    return;
  }
#endif
  rlimit64 nofile;
  if (getrlimit64(RLIMIT_NOFILE, &nofile) == -1) {
    CODEBOX_RAW_PLOG(WARNING, "getrlimit64(RLIMIT_NOFILE)");
    return;
  }
  // fs.nr_open defaults to 2^20, no descriptor can be numbered higher.
  const rlim64_t limit = std::min<rlim64_t>(nofile.rlim_cur, rlim64_t{1} << 20);
  for (rlim64_t fd = STDERR_FILENO + 1; fd < limit; ++fd) {
    close(static_cast<int>(fd));
  }
}

[[noreturn]] void RunAnchor(IsolationLevel level,
                            const IsolationOptions& options,
                            const Limits& limits) {
  const pid_t self = getpid();
  CloseInheritedFds();
  OsIsolationOps ops(options);
  if (absl::Status status = ConfigureIsolation(self, level, ops);
      !status.ok()) {
    CODEBOX_RAW_LOG(FATAL, "Sandbox %d: isolation failed: %.*s", self,
                    static_cast<int>(status.message().size()),
                    status.message().data());
  }
  ApplyLimits(self, limits);
  for (;;) {
    sleep(1);
  }
}

}  // namespace

pid_t SpawnAnchor(IsolationLevel level, const IsolationOptions& options,
                  const Limits& limits) {
  const pid_t pid = fork();
  if (pid == -1) {
    PLOG(ERROR) << "fork()";
    return -1;
  }
  if (pid == 0) {
    RunAnchor(level, options, limits);
  }
  VLOG(1) << "Spawned sandbox anchor " << pid << " ("
          << IsolationLevelName(level) << " isolation)";
  return pid;
}

}  // namespace codebox

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

#include "codebox/sandbox/syscall_filter.h"

#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "codebox/config.h"

namespace codebox {
namespace {

constexpr uint32_t kArchOffset = offsetof(struct seccomp_data, arch);
constexpr uint32_t kNrOffset = offsetof(struct seccomp_data, nr);
// Lower 32 bits of the first argument on little endian hosts.
constexpr uint32_t kArg0Offset = offsetof(struct seccomp_data, args[0]);

constexpr int kAllowedSyscalls[] = {
    __NR_read,          __NR_write,           __NR_exit,
    __NR_exit_group,    __NR_rt_sigreturn,    __NR_restart_syscall,
    __NR_nanosleep,     __NR_clock_nanosleep, __NR_prlimit64,
    __NR_getpid,
};

}  // namespace

absl::Span<const int> AllowedSyscalls() { return kAllowedSyscalls; }

std::vector<sock_filter> BuildSyscallFilter() {
  std::vector<sock_filter> prog = {
      BPF_STMT(BPF_LD | BPF_W | BPF_ABS, kArchOffset),
      BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, host_cpu::AuditArch(), 1, 0),
      BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS),
  };
  for (int nr : AllowedSyscalls()) {
    prog.insert(
        prog.end(),
        {
            BPF_STMT(BPF_LD | BPF_W | BPF_ABS, kNrOffset),
            BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0,
                     4),
            BPF_STMT(BPF_LD | BPF_W | BPF_ABS, kArg0Offset),
            BPF_JUMP(BPF_JMP | BPF_JGE | BPF_K, 0, 1, 0),
            BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS),
            BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW),
        });
  }
  prog.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
  return prog;
}

absl::Status InstallSyscallFilter() {
  std::vector<sock_filter> filter = BuildSyscallFilter();
  struct sock_fprog prog {};
  prog.len = static_cast<unsigned short>(filter.size());
  prog.filter = filter.data();

  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
    return absl::ErrnoToStatus(errno, "prctl(PR_SET_NO_NEW_PRIVS)");
  }
  if (syscall(__NR_seccomp, SECCOMP_SET_MODE_FILTER, 0,
              reinterpret_cast<uintptr_t>(&prog)) != 0) {
    return absl::ErrnoToStatus(errno, "seccomp(SECCOMP_SET_MODE_FILTER)");
  }
  return absl::OkStatus();
}

}  // namespace codebox

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

// The seccomp-bpf program installed as the last hardening step of a
// completely isolated anchor.

#ifndef CODEBOX_SANDBOX_SYSCALL_FILTER_H_
#define CODEBOX_SANDBOX_SYSCALL_FILTER_H_

#include <linux/filter.h>

#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"

namespace codebox {

// Syscall numbers the filter lets through. read, write and exit are the
// workload set, the rest keep the anchor itself alive after the filter is in
// place (limits, raw logging and the park loop).
absl::Span<const int> AllowedSyscalls();

// Builds the filter program. Any other architecture than the host's and any
// syscall not in AllowedSyscalls() kills the process. Each allowed syscall
// sits behind a guard on its first argument that accepts every value.
std::vector<sock_filter> BuildSyscallFilter();

// Sets PR_SET_NO_NEW_PRIVS and installs BuildSyscallFilter() into the calling
// process. Irreversible.
absl::Status InstallSyscallFilter();

}  // namespace codebox

#endif  // CODEBOX_SANDBOX_SYSCALL_FILTER_H_

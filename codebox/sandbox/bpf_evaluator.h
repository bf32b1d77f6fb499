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

// Userspace interpreter for classic BPF programs as accepted by
// seccomp(SECCOMP_SET_MODE_FILTER). Used to check syscall filters without
// installing them into the calling process.

#ifndef CODEBOX_SANDBOX_BPF_EVALUATOR_H_
#define CODEBOX_SANDBOX_BPF_EVALUATOR_H_

#include <linux/filter.h>
#include <linux/seccomp.h>

#include <cstdint>

#include "absl/status/statusor.h"
#include "absl/types/span.h"

namespace codebox::bpf {

// Runs prog against data and returns the value of the first RET reached.
// Malformed programs (unknown opcodes, misaligned or out-of-bounds loads,
// jumps or fall-through past the end) yield InvalidArgumentError.
absl::StatusOr<uint32_t> Evaluate(absl::Span<const sock_filter> prog,
                                  const struct seccomp_data& data);

}  // namespace codebox::bpf

#endif  // CODEBOX_SANDBOX_BPF_EVALUATOR_H_

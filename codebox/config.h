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

// Host architecture as seen by the seccomp filter.

#ifndef CODEBOX_CONFIG_H_
#define CODEBOX_CONFIG_H_

#include <linux/audit.h>

#include <cstdint>

#include "absl/base/config.h"

namespace codebox::host_cpu {

// AUDIT_ARCH_* value the kernel reports in seccomp_data.arch for syscalls of
// this build. Any other value means the call came through another syscall
// table, e.g. the i386 one via int 0x80.
constexpr uint32_t AuditArch() {
#if defined(__x86_64__)
  return AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
  return AUDIT_ARCH_AARCH64;
#elif defined(__powerpc64__) && defined(ABSL_IS_LITTLE_ENDIAN)
  return AUDIT_ARCH_PPC64LE;
#else
  return 0;
#endif
}

static_assert(AuditArch() != 0,
              "Unsupported host: x86-64, AArch64 or little endian POWER64 is "
              "required");

}  // namespace codebox::host_cpu

#endif  // CODEBOX_CONFIG_H_

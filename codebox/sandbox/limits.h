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

// Per-process rlimits applied by the anchor to itself. Unlike namespace
// separation these are best effort: a limit that cannot be set is logged and
// the anchor keeps going.

#ifndef CODEBOX_SANDBOX_LIMITS_H_
#define CODEBOX_SANDBOX_LIMITS_H_

#include <sys/resource.h>
#include <sys/types.h>

#include <cstdint>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace codebox {

enum class ResourceKind {
  kCpuSeconds,     // RLIMIT_CPU
  kFileSizeBytes,  // RLIMIT_FSIZE
};

// Maps kind onto its RLIMIT_* constant.
int RlimitResource(ResourceKind kind);

class Limits final {
 public:
  static constexpr uint64_t kDefaultCpuSeconds = 10;
  static constexpr uint64_t kDefaultFileSizeBytes = uint64_t{20} << 20;

  Limits() = default;

  const rlimit64& rlimit_cpu() const { return rlimit_cpu_; }
  Limits& set_rlimit_cpu(uint64_t seconds) {
    rlimit_cpu_ = MakeRlimit64(seconds);
    return *this;
  }

  const rlimit64& rlimit_fsize() const { return rlimit_fsize_; }
  Limits& set_rlimit_fsize(uint64_t bytes) {
    rlimit_fsize_ = MakeRlimit64(bytes);
    return *this;
  }

  const rlimit64& Get(ResourceKind kind) const {
    return kind == ResourceKind::kCpuSeconds ? rlimit_cpu_ : rlimit_fsize_;
  }

 private:
  static constexpr rlimit64 MakeRlimit64(uint64_t value) {
    return {value, value};
  }

  rlimit64 rlimit_cpu_ = MakeRlimit64(kDefaultCpuSeconds);
  rlimit64 rlimit_fsize_ = MakeRlimit64(kDefaultFileSizeBytes);
};

// Sets both the soft and the hard limit of kind on pid to value. Raising a
// hard limit needs CAP_SYS_RESOURCE, without it the kernel's EPERM comes back
// as PermissionDeniedError and the process keeps its limit.
absl::Status SetLimit(pid_t pid, ResourceKind kind, uint64_t value);

// Returns the limit of kind the calling process currently runs with, which is
// what a sandbox inherits when nothing is set.
absl::StatusOr<rlimit64> GetSystemDefault(ResourceKind kind);

// Applies every limit in limits to pid. Failures are logged with the raw
// logger, so this is usable right after fork().
void ApplyLimits(pid_t pid, const Limits& limits);

}  // namespace codebox

#endif  // CODEBOX_SANDBOX_LIMITS_H_

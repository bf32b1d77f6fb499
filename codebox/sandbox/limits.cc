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

#include "codebox/sandbox/limits.h"

#include <sys/resource.h>
#include <sys/types.h>

#include <cerrno>
#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "codebox/sandbox/util.h"
#include "codebox/util/raw_logging.h"

namespace codebox {
namespace {

// glibc declares the resource parameter as an enum for _GNU_SOURCE builds.
using RlimitResourceType = __rlimit_resource;

int Prlimit64(pid_t pid, ResourceKind kind, const rlimit64* new_limit,
              rlimit64* old_limit) {
  return prlimit64(pid, static_cast<RlimitResourceType>(RlimitResource(kind)),
                   new_limit, old_limit);
}

std::string Describe(pid_t pid, ResourceKind kind) {
  return absl::StrCat("prlimit64(", pid, ", ",
                      util::GetRlimitName(RlimitResource(kind)), ")");
}

}  // namespace

int RlimitResource(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::kCpuSeconds:
      return RLIMIT_CPU;
    case ResourceKind::kFileSizeBytes:
      return RLIMIT_FSIZE;
  }
  return -1;
}

absl::Status SetLimit(pid_t pid, ResourceKind kind, uint64_t value) {
  const rlimit64 limit = {value, value};
  if (Prlimit64(pid, kind, &limit, nullptr) == -1) {
    return absl::ErrnoToStatus(errno,
                               absl::StrCat(Describe(pid, kind), " = ", value));
  }
  return absl::OkStatus();
}

absl::StatusOr<rlimit64> GetSystemDefault(ResourceKind kind) {
  rlimit64 current;
  if (Prlimit64(0, kind, nullptr, &current) == -1) {
    return absl::ErrnoToStatus(errno, Describe(0, kind));
  }
  return current;
}

void ApplyLimits(pid_t pid, const Limits& limits) {
  // The anchor calls this with its syscall filter in place, nothing below may
  // allocate.
  for (ResourceKind kind :
       {ResourceKind::kCpuSeconds, ResourceKind::kFileSizeBytes}) {
    const char* name =
        kind == ResourceKind::kCpuSeconds ? "RLIMIT_CPU" : "RLIMIT_FSIZE";
    const rlimit64& limit = limits.Get(kind);
    if (Prlimit64(pid, kind, &limit, nullptr) == -1) {
      CODEBOX_RAW_PLOG(WARNING, "Sandbox %d: keeping previous %s", pid, name);
      continue;
    }
    CODEBOX_RAW_VLOG(1, "Sandbox %d: %s set to %llu", pid, name,
                     static_cast<unsigned long long>(limit.rlim_cur));  // NOLINT
  }
}

}  // namespace codebox

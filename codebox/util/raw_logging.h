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

// Logging for the anchor process between fork() and parking.
//
// The parent may own threads, so the anchor must not take locks another thread
// could have held at fork time, and once its syscall filter is installed it
// cannot allocate either. Lines are formatted into a stack buffer and written
// to stderr with a single write(2):
//   CODEBOX_RAW_LOG(WARNING, "Sandbox %d: %s", pid, what);
// prints
//   W [4242] [isolation.cc : 120] RAW: Sandbox 4242: ...

#ifndef CODEBOX_UTIL_RAW_LOGGING_H_
#define CODEBOX_UTIL_RAW_LOGGING_H_

#include <cerrno>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"
#include "codebox/util/strerror.h"

#define CODEBOX_RAW_LOG_INTERNAL_INFO ::absl::LogSeverity::kInfo
#define CODEBOX_RAW_LOG_INTERNAL_WARNING ::absl::LogSeverity::kWarning
#define CODEBOX_RAW_LOG_INTERNAL_ERROR ::absl::LogSeverity::kError
#define CODEBOX_RAW_LOG_INTERNAL_FATAL ::absl::LogSeverity::kFatal

// severity is one of INFO, WARNING, ERROR or FATAL. FATAL aborts.
#define CODEBOX_RAW_LOG(severity, ...)                                  \
  ::codebox::raw_logging_internal::RawLog(                              \
      CODEBOX_RAW_LOG_INTERNAL_##severity,                              \
      ::codebox::raw_logging_internal::Basename(__FILE__), __LINE__,    \
      __VA_ARGS__)

// Like CODEBOX_RAW_LOG(), followed by ": <strerror(errno)> [errno]".
#define CODEBOX_RAW_PLOG(severity, format, ...)                          \
  do {                                                                   \
    const int codebox_raw_plog_errno = errno;                            \
    char codebox_raw_plog_buf[128];                                      \
    CODEBOX_RAW_LOG(severity, format ": %s [%d]", ##__VA_ARGS__,         \
                    ::codebox::RawStrError(codebox_raw_plog_errno,       \
                                           codebox_raw_plog_buf,         \
                                           sizeof(codebox_raw_plog_buf)), \
                    codebox_raw_plog_errno);                             \
  } while (0)

// Logs at INFO if CODEBOX_VLOG_LEVEL is at least verbose_level.
#define CODEBOX_RAW_VLOG(verbose_level, ...)                        \
  do {                                                              \
    if (::codebox::raw_logging_internal::VLogIsOn(verbose_level)) { \
      CODEBOX_RAW_LOG(INFO, __VA_ARGS__);                           \
    }                                                               \
  } while (0)

namespace codebox::raw_logging_internal {

inline constexpr int kLogBufSize = 3000;

void RawLog(absl::LogSeverity severity, const char* file, int line,
            const char* format, ...) ABSL_PRINTF_ATTRIBUTE(4, 5);

// Part of path after the last '/'.
constexpr const char* Basename(const char* path) {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') {
      base = p + 1;
    }
  }
  return base;
}

bool VLogIsOn(int verbose_level);

}  // namespace codebox::raw_logging_internal

#endif  // CODEBOX_UTIL_RAW_LOGGING_H_

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


#include "codebox/util/raw_logging.h"

#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

#include "absl/base/log_severity.h"
#include "absl/strings/numbers.h"

namespace codebox::raw_logging_internal {
namespace {

constexpr char kTruncated[] = " [truncated]\n";

// Appends to line[0, capacity) at *used. Returns false if the text did not fit.
bool Append(char* line, size_t capacity, size_t* used, const char* format,
            va_list ap) ABSL_PRINTF_ATTRIBUTE(4, 0);
bool Append(char* line, size_t capacity, size_t* used, const char* format,
            va_list ap) {
  const size_t room = capacity - *used;
  const int n = vsnprintf(line + *used, room, format, ap);
  if (n < 0) {
    return false;
  }
  *used += std::min(static_cast<size_t>(n), room - 1);
  return static_cast<size_t>(n) < room;
}

bool AppendF(char* line, size_t capacity, size_t* used, const char* format,
             ...) ABSL_PRINTF_ATTRIBUTE(4, 5);
bool AppendF(char* line, size_t capacity, size_t* used, const char* format,
             ...) {
  va_list ap;
  va_start(ap, format);
  const bool fit = Append(line, capacity, used, format, ap);
  va_end(ap);
  return fit;
}

}  // namespace

void RawLog(absl::LogSeverity severity, const char* file, int line,
            const char* format, ...) {
  char buffer[kLogBufSize];
  // Reserve the tail so a truncation marker always fits.
  const size_t capacity = sizeof(buffer) - sizeof(kTruncated);
  size_t used = 0;
  AppendF(buffer, capacity, &used, "%c [%d] [%s : %d] RAW: ",
          absl::LogSeverityName(severity)[0],
          static_cast<int>(syscall(SYS_getpid)), file, line);

  va_list ap;
  va_start(ap, format);
  const bool fit = Append(buffer, capacity, &used, format, ap);
  va_end(ap);

  const char* tail = fit ? "\n" : kTruncated;
  memcpy(buffer + used, tail, strlen(tail));
  used += strlen(tail);

  // A single write keeps concurrent lines from interleaving.
  syscall(SYS_write, STDERR_FILENO, buffer, used);

  if (severity == absl::LogSeverity::kFatal) {
    abort();
  }
}

bool VLogIsOn(int verbose_level) {
  // An unset, negative or non-numeric CODEBOX_VLOG_LEVEL disables verbose
  // logging.
  static const int level = [] {
    int parsed;
    const char* env = getenv("CODEBOX_VLOG_LEVEL");
    if (env == nullptr || !absl::SimpleAtoi(env, &parsed) || parsed < 0) {
      return std::numeric_limits<int>::min();
    }
    return parsed;
  }();
  return verbose_level <= level;
}

}  // namespace codebox::raw_logging_internal

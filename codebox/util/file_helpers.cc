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

#include "codebox/util/file_helpers.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "codebox/util/fileops.h"

namespace codebox::file {

using ::codebox::file_util::fileops::FDCloser;

absl::StatusOr<std::string> GetContents(absl::string_view path) {
  const std::string name(path);
  FDCloser fd(TEMP_FAILURE_RETRY(open(name.c_str(), O_RDONLY | O_CLOEXEC)));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  std::string contents;
  char buffer[4096];
  for (;;) {
    const ssize_t n = TEMP_FAILURE_RETRY(read(fd.get(), buffer, sizeof(buffer)));
    if (n == -1) {
      return absl::ErrnoToStatus(errno, absl::StrCat("read(", path, ")"));
    }
    if (n == 0) {
      return contents;
    }
    contents.append(buffer, n);
  }
}

absl::Status SetContents(absl::string_view path, absl::string_view content) {
  const std::string name(path);
  FDCloser fd(TEMP_FAILURE_RETRY(
      open(name.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  if (!file_util::fileops::WriteToFD(fd.get(), content.data(),
                                     content.size())) {
    return absl::ErrnoToStatus(errno, absl::StrCat("write(", path, ")"));
  }
  if (!fd.Close()) {
    return absl::ErrnoToStatus(errno, absl::StrCat("close(", path, ")"));
  }
  return absl::OkStatus();
}

}  // namespace codebox::file

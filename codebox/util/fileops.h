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

// File descriptor ownership and the handful of filesystem operations the
// sandbox needs on staged sources and control files.

#ifndef CODEBOX_UTIL_FILEOPS_H_
#define CODEBOX_UTIL_FILEOPS_H_

#include <cstddef>
#include <string>

namespace codebox::file_util::fileops {

// Owns a file descriptor and closes it when going out of scope.
class FDCloser {
 public:
  explicit FDCloser(int fd = -1) : fd_(fd) {}
  FDCloser(FDCloser&& other) : fd_(other.Release()) {}
  FDCloser& operator=(FDCloser&& other) {
    if (this != &other) {
      Close();
      fd_ = other.Release();
    }
    return *this;
  }
  FDCloser(const FDCloser&) = delete;
  FDCloser& operator=(const FDCloser&) = delete;
  ~FDCloser() { Close(); }

  int get() const { return fd_; }

  // Closes the descriptor now. Returns false if there was none or close()
  // failed.
  bool Close();

  // Gives up ownership and returns the descriptor.
  int Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }

 private:
  int fd_;
};

// Whether path names an existing directory entry. Symlinks are not followed.
bool Exists(const std::string& path);

// Removes path and, if it is a directory, everything below it. A missing path
// counts as removed.
bool DeleteRecursively(const std::string& path);

// Writes all of data to fd, retrying short writes.
bool WriteToFD(int fd, const char* data, size_t size);

}  // namespace codebox::file_util::fileops

#endif  // CODEBOX_UTIL_FILEOPS_H_

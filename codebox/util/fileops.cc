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

#include "codebox/util/fileops.h"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include "codebox/util/path.h"

namespace codebox::file_util::fileops {
namespace {

// Appends the children of dir, without "." and "..", to paths.
bool AppendChildren(const std::string& dir, std::vector<std::string>* paths) {
  DIR* handle = opendir(dir.c_str());
  if (handle == nullptr) {
    return false;
  }
  errno = 0;
  while (const struct dirent* entry = readdir(handle)) {
    if (strcmp(entry->d_name, ".") != 0 && strcmp(entry->d_name, "..") != 0) {
      paths->push_back(file::JoinPath(dir, entry->d_name));
    }
  }
  const bool ok = errno == 0;
  closedir(handle);
  return ok;
}

}  // namespace

bool FDCloser::Close() {
  const int fd = Release();
  // The descriptor is released even if close() reports EINTR.
  return fd != -1 && (close(fd) == 0 || errno == EINTR);
}

bool Exists(const std::string& path) {
  struct stat64 st;
  return lstat64(path.c_str(), &st) == 0;
}

bool DeleteRecursively(const std::string& path) {
  // Directories stay on the stack until their children are gone.
  std::vector<std::string> stack = {path};
  while (!stack.empty()) {
    const std::string& top = stack.back();
    if (unlink(top.c_str()) == 0 || errno == ENOENT) {
      stack.pop_back();
      continue;
    }
    if (errno != EISDIR && errno != EPERM) {
      return false;
    }
    if (rmdir(top.c_str()) == 0 || errno == ENOENT) {
      stack.pop_back();
      continue;
    }
    if (errno != ENOTEMPTY && errno != EEXIST) {
      return false;
    }
    if (!AppendChildren(std::string(top), &stack)) {
      return false;
    }
  }
  return true;
}

bool WriteToFD(int fd, const char* data, size_t size) {
  for (size_t done = 0; done < size;) {
    const ssize_t n = TEMP_FAILURE_RETRY(write(fd, data + done, size - done));
    if (n <= 0) {
      return false;
    }
    done += n;
  }
  return true;
}

}  // namespace codebox::file_util::fileops

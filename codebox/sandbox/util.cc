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

#include "codebox/sandbox/util.h"

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <string>
#include <vector>

#include "absl/base/macros.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "codebox/util/fileops.h"
#include "codebox/util/path.h"

extern char** environ;

namespace codebox::util {
namespace {

using ::codebox::file_util::fileops::FDCloser;

// Drains both pipes until the child closes them. Reading them alternately
// would deadlock once the child fills the pipe that is not being read.
absl::Status DrainPipes(int out_fd, int err_fd, CommunicateResult* result) {
  struct pollfd fds[] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
  std::string* sinks[] = {&result->stdout_output, &result->stderr_output};
  int open_fds = ABSL_ARRAYSIZE(fds);
  char buffer[4096];
  while (open_fds > 0) {
    if (TEMP_FAILURE_RETRY(poll(fds, ABSL_ARRAYSIZE(fds), -1)) == -1) {
      return absl::ErrnoToStatus(errno, "poll()");
    }
    for (size_t i = 0; i < ABSL_ARRAYSIZE(fds); ++i) {
      if (fds[i].fd == -1 || fds[i].revents == 0) {
        continue;
      }
      ssize_t bytes_read =
          TEMP_FAILURE_RETRY(read(fds[i].fd, buffer, sizeof(buffer)));
      if (bytes_read < 0) {
        return absl::ErrnoToStatus(errno, "reading from child pipe");
      }
      if (bytes_read == 0) {
        fds[i].fd = -1;  // poll() skips negative descriptors.
        --open_fds;
        continue;
      }
      absl::StrAppend(sinks[i], absl::string_view(buffer, bytes_read));
    }
  }
  return absl::OkStatus();
}

}  // namespace

CharPtrArray::CharPtrArray(const std::vector<std::string>& vec)
    : content_(absl::StrJoin(vec, absl::string_view("\0", 1))) {
  size_t offset = 0;
  array_.reserve(vec.size() + 1);
  for (const std::string& str : vec) {
    array_.push_back(&content_[offset]);
    offset += str.size() + 1;
  }
  array_.push_back(nullptr);
}

CharPtrArray CharPtrArray::FromStringVector(
    const std::vector<std::string>& vec) {
  return CharPtrArray(vec);
}

std::vector<std::string> CurrentEnvironment() {
  std::vector<std::string> env;
  for (char** entry = environ; entry != nullptr && *entry != nullptr;
       ++entry) {
    env.emplace_back(*entry);
  }
  return env;
}

absl::StatusOr<CommunicateResult> Communicate(
    const std::vector<std::string>& argv,
    const std::vector<std::string>& envv) {
  if (argv.empty()) {
    return absl::InvalidArgumentError("Empty argv");
  }
  int out_pipe[2];
  int err_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) == -1) {
    return absl::ErrnoToStatus(errno, "creating stdout pipe");
  }
  FDCloser out_read{out_pipe[0]};
  FDCloser out_write{out_pipe[1]};
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    return absl::ErrnoToStatus(errno, "creating stderr pipe");
  }
  FDCloser err_read{err_pipe[0]};
  FDCloser err_write{err_pipe[1]};

  posix_spawn_file_actions_t action;
  posix_spawn_file_actions_init(&action);
  struct ActionCleanup {
    ~ActionCleanup() { posix_spawn_file_actions_destroy(action_); }
    posix_spawn_file_actions_t* action_;
  } action_cleanup{&action};

  // The pipe ends are O_CLOEXEC, only the dup2()ed copies survive exec.
  posix_spawn_file_actions_adddup2(&action, out_write.get(), STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&action, err_write.get(), STDERR_FILENO);

  CharPtrArray args = CharPtrArray::FromStringVector(argv);
  CharPtrArray envp = CharPtrArray::FromStringVector(envv);

  pid_t pid;
  // posix_spawnp() reports failures through its return value, not errno.
  if (int err = posix_spawnp(&pid, args.array()[0], &action, nullptr,
                             const_cast<char**>(args.data()),
                             const_cast<char**>(envp.data()));
      err != 0) {
    return absl::ErrnoToStatus(err, absl::StrCat("posix_spawnp(", argv[0], ")"));
  }

  // Close the child ends so EOF is seen once the child exits.
  out_write.Close();
  err_write.Close();

  CommunicateResult result;
  absl::Status drained = DrainPipes(out_read.get(), err_read.get(), &result);
  // Reap the child even if draining failed.
  if (TEMP_FAILURE_RETRY(waitpid(pid, &result.wait_status, 0)) != pid) {
    return absl::ErrnoToStatus(errno, absl::StrCat("waitpid(", pid, ")"));
  }
  if (!drained.ok()) {
    return drained;
  }
  return result;
}

std::string GetProcStatusPath(pid_t pid) {
  return file::JoinPath("/proc", absl::StrCat(pid), "status");
}

std::string GetRlimitName(int resource) {
  switch (resource) {
    case RLIMIT_CPU:
      return "RLIMIT_CPU";
    case RLIMIT_FSIZE:
      return "RLIMIT_FSIZE";
    default:
      return absl::StrCat("UNKNOWN: ", resource);
  }
}

std::string GetSignalName(int signo) {
  constexpr absl::string_view kSignalNames[] = {
      "SIG_0",   "SIGHUP",  "SIGINT",     "SIGQUIT", "SIGILL",    "SIGTRAP",
      "SIGABRT", "SIGBUS",  "SIGFPE",     "SIGKILL", "SIGUSR1",   "SIGSEGV",
      "SIGUSR2", "SIGPIPE", "SIGALRM",    "SIGTERM", "SIGSTKFLT", "SIGCHLD",
      "SIGCONT", "SIGSTOP", "SIGTSTP",    "SIGTTIN", "SIGTTOU",   "SIGURG",
      "SIGXCPU", "SIGXFSZ", "SIGVTALARM", "SIGPROF", "SIGWINCH",  "SIGIO",
      "SIGPWR",  "SIGSYS"};

  if (signo >= SIGRTMIN && signo <= SIGRTMAX) {
    return absl::StrFormat("SIGRT-%d [%d]", signo - SIGRTMIN, signo);
  }
  if (signo < 0 || signo >= static_cast<int>(ABSL_ARRAYSIZE(kSignalNames))) {
    return absl::StrFormat("UNKNOWN_SIGNAL [%d]", signo);
  }
  return absl::StrFormat("%s [%d]", kSignalNames[signo], signo);
}

}  // namespace codebox::util

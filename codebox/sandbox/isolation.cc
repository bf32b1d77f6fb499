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

#include "codebox/sandbox/isolation.h"

#include <fcntl.h>
#include <sched.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "codebox/sandbox/syscall_filter.h"
#include "codebox/util/fileops.h"
#include "codebox/util/path.h"
#include "codebox/util/raw_logging.h"
#include "codebox/util/status_macros.h"

namespace codebox {
namespace {

using ::codebox::file_util::fileops::FDCloser;

absl::Status WriteAt(int dirfd, const std::string& name,
                     absl::string_view value) {
  FDCloser fd(TEMP_FAILURE_RETRY(
      openat(dirfd, name.c_str(), O_WRONLY | O_CLOEXEC)));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", name, ")"));
  }
  if (!file_util::fileops::WriteToFD(fd.get(), value.data(), value.size())) {
    return absl::ErrnoToStatus(
        errno, absl::StrCat("writing '", value, "' to ", name));
  }
  return absl::OkStatus();
}

}  // namespace

absl::string_view IsolationLevelName(IsolationLevel level) {
  switch (level) {
    case IsolationLevel::kMinimal:
      return "minimal";
    case IsolationLevel::kComplete:
      return "complete";
  }
  return "unknown";
}

absl::StatusOr<IsolationLevel> ParseIsolationLevel(absl::string_view name) {
  if (name == "minimal") {
    return IsolationLevel::kMinimal;
  }
  if (name == "complete") {
    return IsolationLevel::kComplete;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown isolation level: '", name,
                   "', expected 'minimal' or 'complete'"));
}

std::string SandboxDirName(pid_t pid) { return absl::StrCat("sandbox_", pid); }

OsIsolationOps::OsIsolationOps(IsolationOptions options)
    : options_(std::move(options)),
      outer_uid_(getuid()),
      outer_gid_(getgid()),
      proc_self_(open("/proc/self", O_PATH | O_DIRECTORY | O_CLOEXEC)) {}

absl::Status OsIsolationOps::UnshareNamespaces() {
  if (unshare(kNamespaceFlags) != 0) {
    return absl::ErrnoToStatus(errno, "unshare()");
  }
  return absl::OkStatus();
}

absl::Status OsIsolationOps::AttachCgroup(pid_t pid) {
  const std::string path =
      file::JoinPath(options_.cgroup_root, SandboxDirName(pid));
  if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
    return absl::ErrnoToStatus(errno, absl::StrCat("mkdir(", path, ")"));
  }
  FDCloser dir(open(path.c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC));
  if (dir.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  cgroup_dir_ = std::move(dir);

  CODEBOX_RETURN_IF_ERROR(WriteCgroupFile("cpu.max", kCgroupCpuMax));
  CODEBOX_RETURN_IF_ERROR(WriteCgroupFile("memory.max", kCgroupMemoryMax));
  return WriteCgroupFile("cgroup.procs", absl::StrCat(pid));
}

absl::Status OsIsolationOps::ChangeRoot(pid_t pid) {
  const std::string path =
      file::JoinPath(options_.chroot_base, SandboxDirName(pid));
  if (chroot(path.c_str()) != 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("chroot(", path, ")"));
  }
  if (chdir("/") != 0) {
    return absl::ErrnoToStatus(errno, "chdir(/)");
  }
  return absl::OkStatus();
}

absl::Status OsIsolationOps::DropPrivileges() {
  if (proc_self_.get() == -1) {
    return absl::FailedPreconditionError("/proc/self was not available");
  }
  // Kernels without the setgroups knob accept gid_map writes as is.
  if (absl::Status status = WriteAt(proc_self_.get(), "setgroups", "deny");
      !status.ok() && !absl::IsNotFound(status)) {
    return status;
  }
  CODEBOX_RETURN_IF_ERROR(
      WriteAt(proc_self_.get(), "uid_map",
              absl::StrCat(kSandboxId, " ", outer_uid_, " 1")));
  return WriteAt(proc_self_.get(), "gid_map",
                 absl::StrCat(kSandboxId, " ", outer_gid_, " 1"));
}

absl::Status OsIsolationOps::CapProcessCount(pid_t /*pid*/) {
  return WriteCgroupFile("pids.max", kCgroupPidsMax);
}

absl::Status OsIsolationOps::DisableNetwork(pid_t pid) {
  // The fresh network namespace has no interfaces besides a down loopback.
  // The classid additionally tags traffic for hosts running the v1 net_cls
  // controller, the unified hierarchy has no such file.
  absl::Status status = WriteCgroupFile("net_cls.classid", kCgroupNetClassId);
  if (absl::IsNotFound(status)) {
    CODEBOX_RAW_VLOG(1, "Sandbox %d: no net_cls controller, relying on netns",
                     pid);
    return absl::OkStatus();
  }
  return status;
}

absl::Status OsIsolationOps::InstallSyscallFilter() {
  return ::codebox::InstallSyscallFilter();
}

absl::Status OsIsolationOps::WriteCgroupFile(absl::string_view name,
                                             absl::string_view value) {
  if (cgroup_dir_.get() == -1) {
    return absl::FailedPreconditionError("Sandbox cgroup is not attached");
  }
  return WriteAt(cgroup_dir_.get(), std::string(name), value);
}

absl::Status ConfigureIsolation(pid_t pid, IsolationLevel level,
                                IsolationOps& ops) {
  CODEBOX_RETURN_IF_ERROR(ops.UnshareNamespaces());
  if (level == IsolationLevel::kMinimal) {
    CODEBOX_RAW_LOG(WARNING,
                    "Sandbox %d runs with minimal isolation: cgroup, chroot, "
                    "id mapping and syscall filtering are skipped",
                    pid);
    return absl::OkStatus();
  }
  CODEBOX_RETURN_IF_ERROR(ops.AttachCgroup(pid));
  CODEBOX_RETURN_IF_ERROR(ops.ChangeRoot(pid));
  CODEBOX_RETURN_IF_ERROR(ops.DropPrivileges());
  CODEBOX_RETURN_IF_ERROR(ops.CapProcessCount(pid));
  CODEBOX_RETURN_IF_ERROR(ops.DisableNetwork(pid));
  CODEBOX_RETURN_IF_ERROR(ops.InstallSyscallFilter());
  CODEBOX_RAW_VLOG(1, "Sandbox %d completely isolated", pid);
  return absl::OkStatus();
}

}  // namespace codebox

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

// Namespace separation and optional hardening applied by an anchor process to
// itself right after fork().

#ifndef CODEBOX_SANDBOX_ISOLATION_H_
#define CODEBOX_SANDBOX_ISOLATION_H_

#include <sched.h>
#include <sys/types.h>

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "codebox/util/fileops.h"

namespace codebox {

enum class IsolationLevel {
  // Namespaces only. Cgroup, chroot, id mapping, seccomp, process-count and
  // network hardening are skipped with a warning.
  kMinimal,
  // Every hardening step, in order.
  kComplete,
};

absl::string_view IsolationLevelName(IsolationLevel level);

// Accepts "minimal" and "complete".
absl::StatusOr<IsolationLevel> ParseIsolationLevel(absl::string_view name);

inline IsolationLevel IsolationLevelFromFlag(bool use_complete_isolation) {
  return use_complete_isolation ? IsolationLevel::kComplete
                                : IsolationLevel::kMinimal;
}

// Namespaces the anchor detaches from in a single unshare() call.
inline constexpr int kNamespaceFlags = CLONE_NEWPID | CLONE_NEWNET |
                                       CLONE_NEWNS | CLONE_NEWUTS |
                                       CLONE_NEWIPC | CLONE_NEWUSER;

// Per-sandbox resource bounds written to the cgroup of a completely isolated
// anchor.
inline constexpr absl::string_view kCgroupCpuMax = "50000 100000";
inline constexpr absl::string_view kCgroupMemoryMax = "134217728";
inline constexpr absl::string_view kCgroupPidsMax = "20";
inline constexpr absl::string_view kCgroupNetClassId = "0";

// Identity the sandboxed workload sees inside its user namespace.
inline constexpr int kSandboxId = 1000;

struct IsolationOptions {
  // Mount point of the cgroup hierarchy. Each anchor gets
  // <cgroup_root>/sandbox_<pid>.
  std::string cgroup_root = "/sys/fs/cgroup";
  // Parent of the pre-provisioned chroot trees, <chroot_base>/sandbox_<pid>.
  std::string chroot_base = "/srv/codebox";
};

// Name of the per-sandbox cgroup and chroot directory.
std::string SandboxDirName(pid_t pid);

// Individual hardening steps. Separated from their ordering so the sequence
// can be checked without privileges.
class IsolationOps {
 public:
  virtual ~IsolationOps() = default;

  virtual absl::Status UnshareNamespaces() = 0;
  // Creates the sandbox cgroup, sets CPU and memory bounds, then moves pid
  // into it.
  virtual absl::Status AttachCgroup(pid_t pid) = 0;
  virtual absl::Status ChangeRoot(pid_t pid) = 0;
  // Denies setgroups and maps kSandboxId onto the outer uid and gid.
  virtual absl::Status DropPrivileges() = 0;
  virtual absl::Status CapProcessCount(pid_t pid) = 0;
  virtual absl::Status DisableNetwork(pid_t pid) = 0;
  virtual absl::Status InstallSyscallFilter() = 0;
};

// Applies the steps to the calling process. Must be constructed before
// UnshareNamespaces() so the outer identity and the /proc entry are captured
// while they are still reachable.
class OsIsolationOps : public IsolationOps {
 public:
  explicit OsIsolationOps(IsolationOptions options);

  absl::Status UnshareNamespaces() override;
  absl::Status AttachCgroup(pid_t pid) override;
  absl::Status ChangeRoot(pid_t pid) override;
  absl::Status DropPrivileges() override;
  absl::Status CapProcessCount(pid_t pid) override;
  absl::Status DisableNetwork(pid_t pid) override;
  absl::Status InstallSyscallFilter() override;

 private:
  // Writes value to a control file of the sandbox cgroup. Works after
  // ChangeRoot() since it goes through the directory descriptor.
  absl::Status WriteCgroupFile(absl::string_view name,
                               absl::string_view value);

  IsolationOptions options_;
  uid_t outer_uid_;
  gid_t outer_gid_;
  file_util::fileops::FDCloser proc_self_;
  file_util::fileops::FDCloser cgroup_dir_;
};

// Runs the hardening sequence for level against the calling process, pid
// being its own id. Stops at the first failing step and returns its status.
absl::Status ConfigureIsolation(pid_t pid, IsolationLevel level,
                                IsolationOps& ops);

}  // namespace codebox

#endif  // CODEBOX_SANDBOX_ISOLATION_H_

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

#include "codebox/sandbox/sandbox.h"

#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "codebox/testing.h"
#include "codebox/util/file_helpers.h"
#include "codebox/util/fileops.h"
#include "codebox/util/path.h"
#include "codebox/util/status_matchers.h"
#include "codebox/util/temp_file.h"

namespace codebox {
namespace {

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Eq;
using ::testing::Gt;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::NotNull;
using ::testing::StrEq;

// Forwards to the real syscalls while counting them.
class CountingProcessControl : public ProcessControl {
 public:
  CountingProcessControl() {
    ON_CALL(*this, Kill).WillByDefault(Invoke(&os_, &OsProcessControl::Kill));
    ON_CALL(*this, WaitPid)
        .WillByDefault(Invoke(&os_, &OsProcessControl::WaitPid));
    ON_CALL(*this, SleepFor)
        .WillByDefault(Invoke(&os_, &OsProcessControl::SleepFor));
  }

  MOCK_METHOD(int, Kill, (pid_t, int), (override));
  MOCK_METHOD(int, WaitPid, (pid_t, int*, int), (override));
  MOCK_METHOD(void, SleepFor, (absl::Duration), (override));

 private:
  OsProcessControl os_;
};

SandboxOptions FastOptions() {
  SandboxOptions options;
  options.termination.max_polls = 100;
  options.termination.poll_interval = absl::Milliseconds(20);
  return options;
}

bool ProcessGone(pid_t pid) {
  errno = 0;
  return kill(pid, 0) == -1 && errno == ESRCH;
}

TEST(SandboxTest, CreateSpawnsReadyAnchor) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create(FastOptions());
  ASSERT_THAT(sandbox, NotNull());
  EXPECT_THAT(sandbox->pid(), Gt(0));
  EXPECT_THAT(sandbox->isolation_level(), Eq(IsolationLevel::kMinimal));
  // The pid stays in the process table until it is reaped, even if the anchor
  // could not isolate itself.
  EXPECT_THAT(sandbox->IsReady(), IsTrue());

  sandbox->Terminate();
  EXPECT_THAT(sandbox->terminated(), IsTrue());
  EXPECT_THAT(sandbox->IsReady(), IsFalse());
  EXPECT_THAT(ProcessGone(sandbox->pid()), IsTrue());
}

TEST(SandboxTest, SecondTerminateReturnsImmediately) {
  auto control = std::make_unique<CountingProcessControl>();
  EXPECT_CALL(*control, Kill(_, SIGTERM)).Times(1);
  EXPECT_CALL(*control, WaitPid(_, _, WNOHANG)).Times(AnyNumber());
  EXPECT_CALL(*control, SleepFor(_)).Times(AnyNumber());

  std::unique_ptr<Sandbox> sandbox =
      Sandbox::Create(FastOptions(), std::move(control));
  ASSERT_THAT(sandbox, NotNull());
  sandbox->Terminate();
  sandbox->Terminate();
  // Nor does the destructor signal again.
  sandbox.reset();
}

TEST(SandboxTest, RunAfterTerminateFails) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create(FastOptions());
  ASSERT_THAT(sandbox, NotNull());
  sandbox->Terminate();
  ExecutionOutcome outcome = sandbox->Run("echo never");
  EXPECT_THAT(outcome.ok(), IsFalse());
  EXPECT_THAT(outcome.output(), HasSubstr("terminated"));
}

TEST(SandboxTest, DestructorTerminatesAnchor) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create(FastOptions());
  ASSERT_THAT(sandbox, NotNull());
  const pid_t pid = sandbox->pid();
  sandbox.reset();
  EXPECT_THAT(ProcessGone(pid), IsTrue());
}

TEST(SandboxTest, RunGoesThroughNamespaceEntryTool) {
  CODEBOX_ASSERT_OK_AND_ASSIGN(std::string dir,
                               CreateTempDir(GetTestTempPath("sandbox_")));
  // Records the target pid and runs the command without entering anything.
  const std::string tool = file::JoinPath(dir, "fake_nsenter");
  ASSERT_THAT(
      file::SetContents(
          tool, "#!/bin/sh\necho \"target=$2\" >&2\nshift 4\nexec \"$@\"\n"),
      IsOk());
  ASSERT_THAT(chmod(tool.c_str(), 0755), Eq(0));

  SandboxOptions options = FastOptions();
  options.injector.nsenter_binary = tool;
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create(options);
  ASSERT_THAT(sandbox, NotNull());

  EXPECT_THAT(sandbox->Run("echo 'Hello from Python!'"),
              Eq(ExecutionOutcome::Success("Hello from Python!")));
  EXPECT_THAT(sandbox->Run("exit 1"),
              Eq(ExecutionOutcome::Failure(
                  absl::StrCat("target=", sandbox->pid()))));
  sandbox->Terminate();
  EXPECT_THAT(file_util::fileops::DeleteRecursively(dir), IsTrue());
}

TEST(SandboxTest, CompleteIsolationWithoutProvisioningNeverIsolates) {
  CODEBOX_SKIP_WITHOUT_ISOLATION_PRIVILEGES;
  CODEBOX_ASSERT_OK_AND_ASSIGN(std::string dir,
                               CreateTempDir(GetTestTempPath("complete_")));
  SandboxOptions options = FastOptions();
  options.isolation_level = IsolationLevel::kComplete;
  // Neither a cgroup mount nor a chroot tree exists here, so the anchor
  // aborts during configuration.
  options.isolation.cgroup_root = file::JoinPath(dir, "cgroup");
  options.isolation.chroot_base = file::JoinPath(dir, "roots");
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create(options);
  ASSERT_THAT(sandbox, NotNull());
  EXPECT_THAT(sandbox->isolation_level(), Eq(IsolationLevel::kComplete));

  int status = 0;
  ASSERT_THAT(waitpid(sandbox->pid(), &status, 0), Eq(sandbox->pid()));
  EXPECT_THAT(WIFSIGNALED(status), IsTrue());
  EXPECT_THAT(WTERMSIG(status), Eq(SIGABRT));
  sandbox->Terminate();
  EXPECT_THAT(file_util::fileops::DeleteRecursively(dir), IsTrue());
}

}  // namespace
}  // namespace codebox

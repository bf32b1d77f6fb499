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

#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstdint>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "codebox/testing.h"
#include "codebox/util/status_matchers.h"

namespace codebox {
namespace {

using ::testing::Eq;
using ::testing::IsFalse;
using ::testing::Le;
using ::testing::Ne;

// Forks a child that idles until the fixture kills it.
class LimitsTest : public testing::Test {
 protected:
  void SetUp() override {
    child_ = fork();
    ASSERT_THAT(child_, Ne(-1));
    if (child_ == 0) {
      for (;;) {
        pause();
      }
    }
  }

  void TearDown() override {
    if (child_ > 0) {
      kill(child_, SIGKILL);
      waitpid(child_, nullptr, 0);
    }
  }

  rlimit64 Current(int resource) {
    rlimit64 limit = {};
    EXPECT_THAT(prlimit64(child_, static_cast<__rlimit_resource>(resource),
                          nullptr, &limit),
                Eq(0));
    return limit;
  }

  pid_t child_ = -1;
};

TEST(LimitsDefaultsTest, AnchorDefaults) {
  Limits limits;
  EXPECT_THAT(limits.rlimit_cpu().rlim_cur, Eq(10));
  EXPECT_THAT(limits.rlimit_cpu().rlim_max, Eq(10));
  EXPECT_THAT(limits.rlimit_fsize().rlim_cur, Eq(20 * 1024 * 1024));
  EXPECT_THAT(limits.Get(ResourceKind::kFileSizeBytes).rlim_max,
              Eq(20 * 1024 * 1024));
  limits.set_rlimit_cpu(3);
  EXPECT_THAT(limits.Get(ResourceKind::kCpuSeconds).rlim_cur, Eq(3));
}

TEST_F(LimitsTest, SetLimitLowersSoftAndHard) {
  ASSERT_THAT(SetLimit(child_, ResourceKind::kCpuSeconds, 7), IsOk());
  rlimit64 cpu = Current(RLIMIT_CPU);
  EXPECT_THAT(cpu.rlim_cur, Eq(7));
  EXPECT_THAT(cpu.rlim_max, Eq(7));
}

TEST_F(LimitsTest, RaisingHardLimitNeedsPrivileges) {
  if (HasIsolationPrivileges()) {
    GTEST_SKIP() << "Root may raise hard limits";
  }
  ASSERT_THAT(SetLimit(child_, ResourceKind::kFileSizeBytes, 4096), IsOk());
  EXPECT_THAT(SetLimit(child_, ResourceKind::kFileSizeBytes, 8192),
              StatusIs(absl::StatusCode::kPermissionDenied));
  EXPECT_THAT(Current(RLIMIT_FSIZE).rlim_cur, Eq(4096));
}

TEST_F(LimitsTest, RestoresSystemDefault) {
  CODEBOX_SKIP_WITHOUT_ISOLATION_PRIVILEGES;
  CODEBOX_ASSERT_OK_AND_ASSIGN(rlimit64 cpu_default,
                               GetSystemDefault(ResourceKind::kCpuSeconds));
  ASSERT_THAT(SetLimit(child_, ResourceKind::kCpuSeconds, 10), IsOk());
  ASSERT_THAT(Current(RLIMIT_CPU).rlim_max, Eq(10));

  EXPECT_THAT(
      SetLimit(child_, ResourceKind::kCpuSeconds, cpu_default.rlim_max),
      IsOk());
  EXPECT_THAT(Current(RLIMIT_CPU).rlim_max, Eq(cpu_default.rlim_max));
}

TEST_F(LimitsTest, ApplyLimitsSetsBothResources) {
  ApplyLimits(child_, Limits());
  EXPECT_THAT(Current(RLIMIT_CPU).rlim_max, Eq(Limits::kDefaultCpuSeconds));
  EXPECT_THAT(Current(RLIMIT_FSIZE).rlim_max,
              Eq(Limits::kDefaultFileSizeBytes));
}

TEST_F(LimitsTest, ApplyLimitsKeepsLowerHardLimit) {
  if (HasIsolationPrivileges()) {
    GTEST_SKIP() << "Root may raise hard limits";
  }
  ASSERT_THAT(SetLimit(child_, ResourceKind::kCpuSeconds, 5), IsOk());
  ApplyLimits(child_, Limits());
  EXPECT_THAT(Current(RLIMIT_CPU).rlim_max, Eq(5));
  EXPECT_THAT(Current(RLIMIT_FSIZE).rlim_max,
              Eq(Limits::kDefaultFileSizeBytes));
}

TEST(SetLimitTest, UnknownProcess) {
  // Pid numbers are capped well below INT32_MAX.
  EXPECT_THAT(SetLimit(0x7ffffff0, ResourceKind::kCpuSeconds, 1).ok(),
              IsFalse());
}

TEST(GetSystemDefaultTest, ReadsCallingProcessLimit) {
  CODEBOX_ASSERT_OK_AND_ASSIGN(rlimit64 fsize,
                               GetSystemDefault(ResourceKind::kFileSizeBytes));
  EXPECT_THAT(fsize.rlim_cur, Le(fsize.rlim_max));
  EXPECT_THAT(RlimitResource(ResourceKind::kCpuSeconds), Eq(RLIMIT_CPU));
}

}  // namespace
}  // namespace codebox

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

#include <cerrno>
#include <cstdlib>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace codebox::raw_logging_internal {
namespace {

using ::testing::StrEq;

TEST(RawLoggingTest, Basename) {
  EXPECT_THAT(Basename("codebox/sandbox/anchor.cc"), StrEq("anchor.cc"));
  EXPECT_THAT(Basename("anchor.cc"), StrEq("anchor.cc"));
}

TEST(RawLoggingDeathTest, FatalAborts) {
  EXPECT_DEATH(CODEBOX_RAW_LOG(FATAL, "anchor %d gone", 42),
               "F \\[[0-9]+\\] \\[raw_logging_test.cc : [0-9]+\\] RAW: "
               "anchor 42 gone");
}

TEST(RawLoggingDeathTest, PlogAppendsErrno) {
  EXPECT_DEATH(
      {
        errno = ESRCH;
        CODEBOX_RAW_PLOG(FATAL, "kill(%d)", 7);
      },
      "RAW: kill\\(7\\): No such process \\[3\\]");
}

TEST(RawLoggingDeathTest, LongMessageIsTruncated) {
  const std::string huge(2 * kLogBufSize, 'x');
  EXPECT_DEATH(CODEBOX_RAW_LOG(FATAL, "%s", huge.c_str()), "x \\[truncated\\]");
}

TEST(RawLoggingDeathTest, VerbosityFromEnvironment) {
  // VLogIsOn caches the level, so each case runs in a fresh child.
  EXPECT_EXIT(
      {
        setenv("CODEBOX_VLOG_LEVEL", "2", 1);
        exit(VLogIsOn(2) && !VLogIsOn(3) ? 0 : 1);
      },
      ::testing::ExitedWithCode(0), "");
  EXPECT_EXIT(
      {
        setenv("CODEBOX_VLOG_LEVEL", "verbose", 1);
        exit(VLogIsOn(0) ? 1 : 0);
      },
      ::testing::ExitedWithCode(0), "");
}

}  // namespace
}  // namespace codebox::raw_logging_internal

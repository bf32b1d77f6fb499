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

#include "codebox/util/strerror.h"

#include <cerrno>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace codebox {
namespace {

using ::testing::Eq;
using ::testing::StrEq;

TEST(RawStrErrorTest, KnownCode) {
  char buf[100];
  errno = EAGAIN;
  EXPECT_THAT(RawStrError(ESRCH, buf, sizeof(buf)), StrEq("No such process"));
  EXPECT_THAT(errno, Eq(EAGAIN));
}

TEST(RawStrErrorTest, UnknownCode) {
  char buf[100];
  EXPECT_THAT(RawStrError(-1, buf, sizeof(buf)), StrEq("Unknown error -1"));
}

}  // namespace
}  // namespace codebox

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

#include "codebox/runner/staging.h"

#include <random>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "codebox/testing.h"
#include "codebox/util/file_helpers.h"
#include "codebox/util/fileops.h"
#include "codebox/util/status_matchers.h"
#include "codebox/util/temp_file.h"

namespace codebox {
namespace {

using ::testing::ContainsRegex;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Ne;
using ::testing::StrEq;

constexpr char kUuidV4Pattern[] =
    "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$";

TEST(GenerateUuidTest, IsVersionFour) {
  for (int i = 0; i < 100; ++i) {
    EXPECT_THAT(GenerateUuid(), ContainsRegex(kUuidV4Pattern));
  }
}

TEST(GenerateUuidTest, FollowsGenerator) {
  std::mt19937_64 first(42);
  std::mt19937_64 second(42);
  const std::string uuid = GenerateUuid(first);
  EXPECT_THAT(uuid, ContainsRegex(kUuidV4Pattern));
  EXPECT_THAT(GenerateUuid(second), StrEq(uuid));
}

TEST(GenerateUuidTest, Distinct) {
  EXPECT_THAT(GenerateUuid(), Ne(GenerateUuid()));
}

TEST(StageSourceTest, WritesCodeUnderId) {
  CODEBOX_ASSERT_OK_AND_ASSIGN(std::string dir,
                               CreateTempDir(GetTestTempPath("stage_")));
  CODEBOX_ASSERT_OK_AND_ASSIGN(
      std::string path,
      StageSource(dir, "0f8fad5b-d9cb-469f-a165-70867728950e", ".py",
                  "print('Hello from Python!')\n"));
  EXPECT_THAT(path,
              StrEq(dir + "/0f8fad5b-d9cb-469f-a165-70867728950e.py"));
  EXPECT_THAT(file::GetContents(path),
              IsOkAndHolds(StrEq("print('Hello from Python!')\n")));

  RemoveStaged(path);
  EXPECT_THAT(file_util::fileops::Exists(path), IsFalse());
  // Removing twice is fine.
  RemoveStaged(path);
  EXPECT_THAT(file_util::fileops::DeleteRecursively(dir), IsTrue());
}

TEST(StageSourceTest, MissingDirectoryIsAnError) {
  EXPECT_THAT(StageSource("/nonexistent/codebox", "id", ".cpp", "int x;"),
              StatusIs(absl::StatusCode::kNotFound));
}

}  // namespace
}  // namespace codebox

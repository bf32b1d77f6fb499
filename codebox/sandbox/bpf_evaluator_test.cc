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

#include "codebox/sandbox/bpf_evaluator.h"

#include <linux/filter.h>
#include <linux/seccomp.h>

#include <cstddef>
#include <cstdint>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "codebox/util/status_matchers.h"

namespace codebox::bpf {
namespace {

using ::testing::Eq;

constexpr uint32_t kNrOffset = offsetof(struct seccomp_data, nr);

TEST(EvaluatorTest, SimpleReturn) {
  sock_filter prog[] = {
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_ALLOW),
  };
  CODEBOX_ASSERT_OK_AND_ASSIGN(uint32_t result, Evaluate(prog, {.nr = 1}));
  EXPECT_THAT(result, Eq(SECCOMP_RET_ALLOW));
}

TEST(EvaluatorTest, ReturnAccumulator) {
  sock_filter prog[] = {
      BPF_STMT(BPF_LD + BPF_IMM, SECCOMP_RET_ERRNO),
      BPF_STMT(BPF_RET + BPF_A, 0),
  };
  CODEBOX_ASSERT_OK_AND_ASSIGN(uint32_t result, Evaluate(prog, {}));
  EXPECT_THAT(result, Eq(SECCOMP_RET_ERRNO));
}

TEST(EvaluatorTest, ConditionalJumpOnSyscallNumber) {
  sock_filter prog[] = {
      BPF_STMT(BPF_LD + BPF_W + BPF_ABS, kNrOffset),
      BPF_JUMP(BPF_JMP + BPF_JEQ + BPF_K, 1, 0, 1),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_ALLOW),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_KILL_PROCESS),
  };
  CODEBOX_ASSERT_OK_AND_ASSIGN(uint32_t result, Evaluate(prog, {.nr = 1}));
  EXPECT_THAT(result, Eq(SECCOMP_RET_ALLOW));
  CODEBOX_ASSERT_OK_AND_ASSIGN(result, Evaluate(prog, {.nr = 2}));
  EXPECT_THAT(result, Eq(SECCOMP_RET_KILL_PROCESS));
}

TEST(EvaluatorTest, AbsoluteJump) {
  sock_filter prog[] = {
      BPF_STMT(BPF_JMP + BPF_JA, 1),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_ALLOW),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_KILL_PROCESS),
  };
  CODEBOX_ASSERT_OK_AND_ASSIGN(uint32_t result, Evaluate(prog, {}));
  EXPECT_THAT(result, Eq(SECCOMP_RET_KILL_PROCESS));
}

TEST(EvaluatorTest, RegisterTransfers) {
  sock_filter prog[] = {
      BPF_STMT(BPF_LDX + BPF_IMM, 7),
      BPF_STMT(BPF_MISC + BPF_TXA, 0),
      BPF_STMT(BPF_ALU + BPF_ADD + BPF_K, 1),
      BPF_STMT(BPF_MISC + BPF_TAX, 0),
      BPF_STMT(BPF_LD + BPF_IMM, 8),
      BPF_JUMP(BPF_JMP + BPF_JEQ + BPF_X, 0, 0, 1),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_ALLOW),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_KILL_PROCESS),
  };
  CODEBOX_ASSERT_OK_AND_ASSIGN(uint32_t result, Evaluate(prog, {}));
  EXPECT_THAT(result, Eq(SECCOMP_RET_ALLOW));
}

TEST(EvaluatorTest, LoadLen) {
  sock_filter prog[] = {
      BPF_STMT(BPF_LD + BPF_LEN, 0),
      BPF_JUMP(BPF_JMP + BPF_JEQ + BPF_K, sizeof(struct seccomp_data), 0, 1),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_ALLOW),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_KILL_PROCESS),
  };
  CODEBOX_ASSERT_OK_AND_ASSIGN(uint32_t result, Evaluate(prog, {}));
  EXPECT_THAT(result, Eq(SECCOMP_RET_ALLOW));
}

TEST(EvaluatorTest, DivisionByZero) {
  sock_filter prog[] = {
      BPF_STMT(BPF_ALU + BPF_DIV + BPF_K, 0),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_ALLOW),
  };
  EXPECT_THAT(Evaluate(prog, {}),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(EvaluatorTest, Shifts) {
  sock_filter prog[] = {
      BPF_STMT(BPF_LD + BPF_IMM, 0x10),
      BPF_STMT(BPF_ALU + BPF_LSH + BPF_K, 4),
      BPF_STMT(BPF_ALU + BPF_RSH + BPF_K, 1),
      BPF_STMT(BPF_RET + BPF_A, 0),
  };
  EXPECT_THAT(Evaluate(prog, {}), IsOkAndHolds(Eq(0x80)));

  for (uint16_t op : {BPF_LSH, BPF_RSH}) {
    sock_filter too_wide[] = {
        BPF_STMT(BPF_LD + BPF_IMM, 1),
        BPF_STMT(static_cast<uint16_t>(BPF_ALU + op + BPF_K), 32),
        BPF_STMT(BPF_RET + BPF_A, 0),
    };
    EXPECT_THAT(Evaluate(too_wide, {}),
                StatusIs(absl::StatusCode::kInvalidArgument));
  }
}

TEST(EvaluatorTest, MalformedPrograms) {
  sock_filter misaligned[] = {
      BPF_STMT(BPF_LD + BPF_W + BPF_ABS, 1),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_ALLOW),
  };
  EXPECT_THAT(Evaluate(misaligned, {}),
              StatusIs(absl::StatusCode::kInvalidArgument));

  sock_filter out_of_bounds_read[] = {
      BPF_STMT(BPF_LD + BPF_W + BPF_ABS, sizeof(struct seccomp_data)),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_ALLOW),
  };
  EXPECT_THAT(Evaluate(out_of_bounds_read, {}),
              StatusIs(absl::StatusCode::kInvalidArgument));

  sock_filter out_of_bounds_jump[] = {
      BPF_STMT(BPF_JMP + BPF_JA, 1),
      BPF_STMT(BPF_RET + BPF_K, SECCOMP_RET_ALLOW),
  };
  EXPECT_THAT(Evaluate(out_of_bounds_jump, {}),
              StatusIs(absl::StatusCode::kInvalidArgument));

  sock_filter fall_through[] = {
      BPF_STMT(BPF_LD + BPF_IMM, 0),
  };
  EXPECT_THAT(Evaluate(fall_through, {}),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace codebox::bpf

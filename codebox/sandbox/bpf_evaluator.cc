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
#include <cstring>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "codebox/util/status_macros.h"

namespace codebox::bpf {
namespace {

absl::StatusOr<uint32_t> ApplyAlu(uint16_t op, uint32_t a, uint32_t b) {
  switch (op) {
    case BPF_ADD:
      return a + b;
    case BPF_SUB:
      return a - b;
    case BPF_MUL:
      return a * b;
    case BPF_DIV:
      if (b == 0) {
        return absl::InvalidArgumentError("Division by zero");
      }
      return a / b;
    case BPF_AND:
      return a & b;
    case BPF_OR:
      return a | b;
    case BPF_XOR:
      return a ^ b;
    case BPF_LSH:
    case BPF_RSH:
      if (b >= 32) {
        return absl::InvalidArgumentError(
            absl::StrCat("Shift by ", b, " bits"));
      }
      return op == BPF_LSH ? a << b : a >> b;
    case BPF_NEG:
      return -a;
  }
  return absl::InvalidArgumentError(absl::StrCat("Invalid ALU op ", op));
}

absl::StatusOr<bool> ApplyCondition(uint16_t op, uint32_t a, uint32_t b) {
  switch (op) {
    case BPF_JEQ:
      return a == b;
    case BPF_JGT:
      return a > b;
    case BPF_JGE:
      return a >= b;
    case BPF_JSET:
      return (a & b) != 0;
  }
  return absl::InvalidArgumentError(absl::StrCat("Invalid jump op ", op));
}

// Register file of the classic BPF machine. Scratch memory is not modelled,
// seccomp filters built in this project never use it.
struct Machine {
  size_t pc = 0;
  uint32_t a = 0;
  uint32_t x = 0;
};

absl::StatusOr<uint32_t> LoadWord(const struct seccomp_data& data,
                                  uint32_t offset) {
  if (offset % sizeof(uint32_t) != 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Misaligned read (", offset, ")"));
  }
  if (offset > sizeof(data) - sizeof(uint32_t)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Out of bounds read (", offset, ")"));
  }
  uint32_t word;
  memcpy(&word, reinterpret_cast<const char*>(&data) + offset, sizeof(word));
  return word;
}

}  // namespace

absl::StatusOr<uint32_t> Evaluate(absl::Span<const sock_filter> prog,
                                  const struct seccomp_data& data) {
  Machine m;
  // Classic BPF only jumps forward, so the loop is bounded by prog.size().
  while (m.pc < prog.size()) {
    const sock_filter& inst = prog[m.pc];
    const uint32_t operand = BPF_SRC(inst.code) == BPF_K ? inst.k : m.x;
    size_t skip = 0;

    switch (BPF_CLASS(inst.code)) {
      case BPF_RET:
        if (BPF_RVAL(inst.code) == BPF_K) {
          return inst.k;
        }
        if (BPF_RVAL(inst.code) == BPF_A) {
          return m.a;
        }
        return absl::InvalidArgumentError("Invalid return source");
      case BPF_LD:
        if (inst.code == (BPF_LD | BPF_W | BPF_ABS)) {
          CODEBOX_ASSIGN_OR_RETURN(m.a, LoadWord(data, inst.k));
        } else if (inst.code == (BPF_LD | BPF_W | BPF_LEN)) {
          m.a = sizeof(struct seccomp_data);
        } else if (inst.code == (BPF_LD | BPF_IMM)) {
          m.a = inst.k;
        } else {
          return absl::InvalidArgumentError(
              absl::StrCat("Invalid instruction ", inst.code));
        }
        break;
      case BPF_LDX:
        if (inst.code == (BPF_LDX | BPF_IMM)) {
          m.x = inst.k;
        } else if (inst.code == (BPF_LDX | BPF_W | BPF_LEN)) {
          m.x = sizeof(struct seccomp_data);
        } else {
          return absl::InvalidArgumentError(
              absl::StrCat("Invalid instruction ", inst.code));
        }
        break;
      case BPF_MISC:
        if (BPF_MISCOP(inst.code) == BPF_TAX) {
          m.x = m.a;
        } else {
          m.a = m.x;
        }
        break;
      case BPF_ALU: {
        CODEBOX_ASSIGN_OR_RETURN(m.a,
                                 ApplyAlu(BPF_OP(inst.code), m.a, operand));
        break;
      }
      case BPF_JMP:
        if (BPF_OP(inst.code) == BPF_JA) {
          skip = inst.k;
        } else {
          CODEBOX_ASSIGN_OR_RETURN(
              bool taken, ApplyCondition(BPF_OP(inst.code), m.a, operand));
          skip = taken ? inst.jt : inst.jf;
        }
        break;
      default:
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid instruction ", inst.code));
    }

    if (skip != 0 && skip >= prog.size() - m.pc - 1) {
      return absl::InvalidArgumentError("Out of bounds jump");
    }
    m.pc += 1 + skip;
  }
  return absl::InvalidArgumentError("Fall through to out of bounds execution");
}

}  // namespace codebox::bpf

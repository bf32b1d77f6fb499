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

#ifndef CODEBOX_SANDBOX_EXECUTION_OUTCOME_H_
#define CODEBOX_SANDBOX_EXECUTION_OUTCOME_H_

#include <ostream>
#include <string>
#include <utility>

namespace codebox {

// Result of one command run inside a sandbox. Either the command succeeded
// and output() is its stdout, or it failed and output() is its stderr (or a
// description of why it could not be run). Both carry text meant for the
// requester, which is why this is not an absl::Status.
class ExecutionOutcome {
 public:
  static ExecutionOutcome Success(std::string output) {
    return ExecutionOutcome(true, std::move(output));
  }
  static ExecutionOutcome Failure(std::string error) {
    return ExecutionOutcome(false, std::move(error));
  }

  bool ok() const { return ok_; }
  const std::string& output() const& { return output_; }
  std::string output() && { return std::move(output_); }

  std::string ToString() const;

  bool operator==(const ExecutionOutcome& other) const {
    return ok_ == other.ok_ && output_ == other.output_;
  }
  bool operator!=(const ExecutionOutcome& other) const {
    return !(*this == other);
  }

 private:
  ExecutionOutcome(bool ok, std::string output)
      : ok_(ok), output_(std::move(output)) {}

  bool ok_;
  std::string output_;
};

std::ostream& operator<<(std::ostream& os, const ExecutionOutcome& outcome);

}  // namespace codebox

#endif  // CODEBOX_SANDBOX_EXECUTION_OUTCOME_H_

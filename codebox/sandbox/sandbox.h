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

// The Sandbox class owns one anchor process and runs commands inside its
// namespaces.
//
// Typical use:
//   std::unique_ptr<Sandbox> sandbox = Sandbox::Create(options);
//   if (!sandbox) { ... }
//   while (!sandbox->IsReady()) { ... }
//   ExecutionOutcome outcome = sandbox->Run("python3 /tmp/x.py");
//   sandbox->Terminate();

#ifndef CODEBOX_SANDBOX_SANDBOX_H_
#define CODEBOX_SANDBOX_SANDBOX_H_

#include <sys/types.h>

#include <memory>

#include "absl/strings/string_view.h"
#include "codebox/sandbox/command_injector.h"
#include "codebox/sandbox/execution_outcome.h"
#include "codebox/sandbox/isolation.h"
#include "codebox/sandbox/limits.h"
#include "codebox/sandbox/termination.h"

namespace codebox {

struct SandboxOptions {
  IsolationLevel isolation_level = IsolationLevel::kMinimal;
  IsolationOptions isolation;
  Limits limits;
  InjectorOptions injector;
  TerminationPolicy termination;
};

// What the execution recipes need from a sandbox.
class SandboxInterface {
 public:
  virtual ~SandboxInterface() = default;

  // Whether the anchor process exists. This does not mean that its isolation
  // is complete, only that the pid is still in the process table.
  virtual bool IsReady() const = 0;

  // Runs cmd with sh inside the sandbox and waits for it. Callers should see
  // IsReady() return true first, this is not enforced.
  virtual ExecutionOutcome Run(absl::string_view cmd) = 0;

  // Stops the anchor. Idempotent, later calls return immediately.
  virtual void Terminate() = 0;
};

class Sandbox final : public SandboxInterface {
 public:
  // Spawns the anchor. Returns nullptr if no process could be created.
  static std::unique_ptr<Sandbox> Create(const SandboxOptions& options = {});
  static std::unique_ptr<Sandbox> Create(
      const SandboxOptions& options, std::unique_ptr<ProcessControl> control);

  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  // Terminates the anchor unless that already happened.
  ~Sandbox() override;

  pid_t pid() const { return pid_; }
  IsolationLevel isolation_level() const { return options_.isolation_level; }
  bool terminated() const { return terminated_; }

  bool IsReady() const override;
  ExecutionOutcome Run(absl::string_view cmd) override;
  void Terminate() override;

 private:
  Sandbox(pid_t pid, const SandboxOptions& options,
          std::unique_ptr<ProcessControl> control);

  const pid_t pid_;
  const SandboxOptions options_;
  std::unique_ptr<ProcessControl> control_;
  bool terminated_ = false;
};

}  // namespace codebox

#endif  // CODEBOX_SANDBOX_SANDBOX_H_

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

// Runs shell commands inside the PID namespace of a sandbox anchor.

#ifndef CODEBOX_SANDBOX_COMMAND_INJECTOR_H_
#define CODEBOX_SANDBOX_COMMAND_INJECTOR_H_

#include <sys/types.h>

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "codebox/sandbox/execution_outcome.h"

namespace codebox {

struct InjectorOptions {
  // Namespace entry tool, looked up in PATH.
  std::string nsenter_binary = "nsenter";
  // Shell that interprets the injected command inside the namespace.
  std::string shell = "sh";
};

// Returns the argv that runs cmd in the PID namespace of pid:
//   nsenter --target <pid> --pid -- sh -c <cmd>
// cmd is passed as a single argument, no outer shell re-parses it.
std::vector<std::string> BuildInjectionCommand(
    pid_t pid, absl::string_view cmd,
    const InjectorOptions& options = InjectorOptions());

// Runs argv to completion. Exit status 0 yields Success(stdout), anything else
// (non-zero exit or death by signal) Failure(stderr), both with trailing
// whitespace removed. A program that cannot be started yields
// Failure(<reason>).
ExecutionOutcome RunCapturing(const std::vector<std::string>& argv);

// RunCapturing(BuildInjectionCommand(pid, cmd, options)).
ExecutionOutcome InjectCommand(
    pid_t pid, absl::string_view cmd,
    const InjectorOptions& options = InjectorOptions());

}  // namespace codebox

#endif  // CODEBOX_SANDBOX_COMMAND_INJECTOR_H_

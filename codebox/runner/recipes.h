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

// Per-language execution flows: stage the submitted code, wait for a sandbox,
// run the interpreter or compiler in it and turn the result into a response.

#ifndef CODEBOX_RUNNER_RECIPES_H_
#define CODEBOX_RUNNER_RECIPES_H_

#include <functional>
#include <memory>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "codebox/sandbox/sandbox.h"

namespace codebox {

struct ExecutionRequest {
  std::string code;
};

// How a request ended. Only output is meant for the requester, kind exists
// so callers can tell e.g. an empty run failure from an empty success.
enum class ResponseKind {
  kSucceeded,
  kRunFailed,
  kCompileFailed,
  kTimedOut,
  kSandboxUnavailable,
  kStagingFailed,
};

absl::string_view ResponseKindName(ResponseKind kind);

struct ExecutionResponse {
  std::string output;
  ResponseKind kind = ResponseKind::kSucceeded;
};

// Returns a fresh sandbox, or nullptr if none could be created.
using SandboxFactory = std::function<std::unique_ptr<SandboxInterface>()>;

struct RecipeOptions {
  // Defaults to Sandbox::Create(sandbox_options).
  SandboxFactory sandbox_factory;
  SandboxOptions sandbox_options;
  // Overall wall-clock budget for the sandbox to become ready, and the pause
  // between two readiness checks.
  absl::Duration ready_timeout = absl::Seconds(15);
  absl::Duration ready_poll_interval = absl::Seconds(1);
  // Where sources and binaries are staged. Must be reachable under the same
  // path from inside the sandbox.
  std::string staging_dir = "/tmp";
  std::string python_binary = "python3";
  std::string cxx_compiler = "g++";
};

// Runs request.code as a Python script.
ExecutionResponse RunPython(const ExecutionRequest& request,
                            const RecipeOptions& options = {});

// Compiles request.code as C++ and runs the binary if compilation succeeded.
ExecutionResponse RunCpp(const ExecutionRequest& request,
                         const RecipeOptions& options = {});

}  // namespace codebox

#endif  // CODEBOX_RUNNER_RECIPES_H_

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

#include "codebox/runner/recipes.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/cleanup/cleanup.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "codebox/runner/staging.h"
#include "codebox/sandbox/execution_outcome.h"
#include "codebox/sandbox/sandbox.h"

namespace codebox {
namespace {

constexpr absl::string_view kSandboxUnavailable = "Failed to create sandbox";
constexpr absl::string_view kTimedOut = "Execution timed out";

std::unique_ptr<SandboxInterface> NewSandbox(const RecipeOptions& options) {
  if (options.sandbox_factory) {
    return options.sandbox_factory();
  }
  return Sandbox::Create(options.sandbox_options);
}

// Polls until the sandbox reports ready or the budget is spent.
bool WaitUntilReady(const SandboxInterface& sandbox,
                    const RecipeOptions& options) {
  const absl::Time deadline = absl::Now() + options.ready_timeout;
  while (absl::Now() < deadline) {
    if (sandbox.IsReady()) {
      return true;
    }
    absl::SleepFor(options.ready_poll_interval);
  }
  return false;
}

ExecutionResponse FromOutcome(ExecutionOutcome outcome) {
  const ResponseKind kind =
      outcome.ok() ? ResponseKind::kSucceeded : ResponseKind::kRunFailed;
  return {std::move(outcome).output(), kind};
}

ExecutionResponse StagingFailed(const absl::Status& status) {
  return {absl::StrCat("Failed to write code to file: ", status.message()),
          ResponseKind::kStagingFailed};
}

}  // namespace

absl::string_view ResponseKindName(ResponseKind kind) {
  switch (kind) {
    case ResponseKind::kSucceeded:
      return "succeeded";
    case ResponseKind::kRunFailed:
      return "run failed";
    case ResponseKind::kCompileFailed:
      return "compile failed";
    case ResponseKind::kTimedOut:
      return "timed out";
    case ResponseKind::kSandboxUnavailable:
      return "sandbox unavailable";
    case ResponseKind::kStagingFailed:
      return "staging failed";
  }
  return "unknown";
}

ExecutionResponse RunPython(const ExecutionRequest& request,
                            const RecipeOptions& options) {
  std::unique_ptr<SandboxInterface> sandbox = NewSandbox(options);
  if (!sandbox) {
    return {std::string(kSandboxUnavailable),
            ResponseKind::kSandboxUnavailable};
  }

  absl::StatusOr<std::string> script =
      StageSource(options.staging_dir, GenerateUuid(), ".py", request.code);
  if (!script.ok()) {
    sandbox->Terminate();
    return StagingFailed(script.status());
  }
  absl::Cleanup remove_script = [&script] { RemoveStaged(*script); };

  if (!WaitUntilReady(*sandbox, options)) {
    LOG(WARNING) << "Sandbox not ready within " << options.ready_timeout;
    sandbox->Terminate();
    return {std::string(kTimedOut), ResponseKind::kTimedOut};
  }
  ExecutionOutcome outcome =
      sandbox->Run(absl::StrCat(options.python_binary, " ", *script));
  sandbox->Terminate();
  return FromOutcome(std::move(outcome));
}

ExecutionResponse RunCpp(const ExecutionRequest& request,
                         const RecipeOptions& options) {
  std::unique_ptr<SandboxInterface> sandbox = NewSandbox(options);
  if (!sandbox) {
    return {std::string(kSandboxUnavailable),
            ResponseKind::kSandboxUnavailable};
  }

  const std::string id = GenerateUuid();
  absl::StatusOr<std::string> source =
      StageSource(options.staging_dir, id, ".cpp", request.code);
  if (!source.ok()) {
    sandbox->Terminate();
    return StagingFailed(source.status());
  }
  // Same name as the source, without the extension.
  const std::string binary =
      source->substr(0, source->size() - absl::string_view(".cpp").size());
  absl::Cleanup remove_files = [&source, &binary] {
    RemoveStaged(*source);
    RemoveStaged(binary);
  };

  if (!WaitUntilReady(*sandbox, options)) {
    LOG(WARNING) << "Sandbox not ready within " << options.ready_timeout;
    sandbox->Terminate();
    return {std::string(kTimedOut), ResponseKind::kTimedOut};
  }

  ExecutionOutcome compiled = sandbox->Run(
      absl::StrCat(options.cxx_compiler, " -o ", binary, " ", *source));
  if (!compiled.ok()) {
    VLOG(1) << "Compilation of " << *source << " failed";
    sandbox->Terminate();
    return {absl::StrCat("Compilation failed:\n", compiled.output()),
            ResponseKind::kCompileFailed};
  }

  ExecutionOutcome outcome = sandbox->Run(binary);
  sandbox->Terminate();
  return FromOutcome(std::move(outcome));
}

}  // namespace codebox

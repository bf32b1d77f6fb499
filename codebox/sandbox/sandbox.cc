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

#include "codebox/sandbox/sandbox.h"

#include <sys/types.h>

#include <memory>
#include <utility>

#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "codebox/sandbox/anchor.h"
#include "codebox/sandbox/command_injector.h"
#include "codebox/sandbox/termination.h"
#include "codebox/sandbox/util.h"
#include "codebox/util/fileops.h"

namespace codebox {

std::unique_ptr<Sandbox> Sandbox::Create(const SandboxOptions& options) {
  return Create(options, std::make_unique<OsProcessControl>());
}

std::unique_ptr<Sandbox> Sandbox::Create(
    const SandboxOptions& options, std::unique_ptr<ProcessControl> control) {
  const pid_t pid =
      SpawnAnchor(options.isolation_level, options.isolation, options.limits);
  if (pid == -1) {
    LOG(ERROR) << "Failed to create sandbox";
    return nullptr;
  }
  return absl::WrapUnique(new Sandbox(pid, options, std::move(control)));
}

Sandbox::Sandbox(pid_t pid, const SandboxOptions& options,
                 std::unique_ptr<ProcessControl> control)
    : pid_(pid), options_(options), control_(std::move(control)) {}

Sandbox::~Sandbox() { Terminate(); }

bool Sandbox::IsReady() const {
  return file_util::fileops::Exists(util::GetProcStatusPath(pid_));
}

ExecutionOutcome Sandbox::Run(absl::string_view cmd) {
  if (terminated_) {
    return ExecutionOutcome::Failure(
        absl::StrCat("Sandbox ", pid_, " has been terminated"));
  }
  return InjectCommand(pid_, cmd, options_.injector);
}

void Sandbox::Terminate() {
  if (terminated_) {
    return;
  }
  terminated_ = true;
  if (absl::Status status =
          TerminateProcess(pid_, *control_, options_.termination);
      !status.ok()) {
    LOG(WARNING) << "Terminating sandbox " << pid_ << ": " << status;
  }
}

}  // namespace codebox

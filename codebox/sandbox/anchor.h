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

#ifndef CODEBOX_SANDBOX_ANCHOR_H_
#define CODEBOX_SANDBOX_ANCHOR_H_

#include <sys/types.h>

#include "codebox/sandbox/isolation.h"
#include "codebox/sandbox/limits.h"

namespace codebox {

// Forks the anchor process of a sandbox and returns its pid, or -1 if fork()
// failed.
//
// The child isolates itself according to level, applies limits and then
// parks in a 1 second sleep loop so its namespaces stay alive until it is
// signalled. A failing isolation step aborts the child; the parent is not
// told and learns about it only through the dead pid.
pid_t SpawnAnchor(IsolationLevel level, const IsolationOptions& options,
                  const Limits& limits);

}  // namespace codebox

#endif  // CODEBOX_SANDBOX_ANCHOR_H_

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

// Process-wide settings resolved once from the environment.

#ifndef CODEBOX_RUNNER_SETTINGS_H_
#define CODEBOX_RUNNER_SETTINGS_H_

#include <functional>
#include <optional>
#include <string>

#include "absl/strings/string_view.h"
#include "codebox/sandbox/isolation.h"

namespace codebox {

inline constexpr absl::string_view kAppHostVariable = "APP_HOST";
inline constexpr absl::string_view kCompleteIsolationVariable =
    "USE_COMPLETE_ISOLATION";

struct Settings {
  // Address a request transport binds to.
  std::string app_host = "127.0.0.1:8000";
  bool use_complete_isolation = false;

  IsolationLevel isolation_level() const {
    return IsolationLevelFromFlag(use_complete_isolation);
  }
};

// Returns the value of a variable, or std::nullopt if it is unset.
using VariableLookup =
    std::function<std::optional<std::string>(absl::string_view name)>;

// Builds Settings from lookup, keeping defaults for unset variables. A
// USE_COMPLETE_ISOLATION value that is not a boolean is logged and treated as
// false.
Settings ParseSettings(const VariableLookup& lookup);

// ParseSettings() over the process environment.
Settings SettingsFromEnv();

}  // namespace codebox

#endif  // CODEBOX_RUNNER_SETTINGS_H_

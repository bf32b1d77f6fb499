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

#include "codebox/runner/settings.h"

#include <cstdlib>
#include <optional>
#include <string>

#include "absl/log/log.h"
#include "absl/strings/numbers.h"
#include "absl/strings/string_view.h"

namespace codebox {

Settings ParseSettings(const VariableLookup& lookup) {
  Settings settings;
  if (std::optional<std::string> host = lookup(kAppHostVariable)) {
    settings.app_host = *std::move(host);
  }
  if (std::optional<std::string> complete =
          lookup(kCompleteIsolationVariable)) {
    if (!absl::SimpleAtob(*complete, &settings.use_complete_isolation)) {
      LOG(WARNING) << kCompleteIsolationVariable << "='" << *complete
                   << "' is not a boolean, using minimal isolation";
      settings.use_complete_isolation = false;
    }
  }
  VLOG(1) << "Settings: app_host=" << settings.app_host << ", isolation="
          << IsolationLevelName(settings.isolation_level());
  return settings;
}

Settings SettingsFromEnv() {
  return ParseSettings(
      [](absl::string_view name) -> std::optional<std::string> {
        const char* value = getenv(std::string(name).c_str());
        if (value == nullptr) {
          return std::nullopt;
        }
        return std::string(value);
      });
}

}  // namespace codebox

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

// Runs one piece of code in a fresh sandbox and prints what it produced.
//
// Example usage:
//   codebox_run --language=python hello.py
//   echo 'int main() {}' | codebox_run --language=cpp --isolation=complete -

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/time/time.h"
#include "codebox/runner/recipes.h"
#include "codebox/runner/settings.h"
#include "codebox/sandbox/isolation.h"
#include "codebox/util/file_helpers.h"

ABSL_FLAG(std::string, language, "python",
          "Language of the submitted code, 'python' or 'cpp'");
ABSL_FLAG(std::string, isolation, "",
          "Isolation level, 'minimal' or 'complete'. When empty, "
          "USE_COMPLETE_ISOLATION decides");
ABSL_FLAG(absl::Duration, ready_timeout, absl::Seconds(15),
          "How long to wait for the sandbox to come up");
ABSL_FLAG(std::string, cgroup_root, "/sys/fs/cgroup",
          "Directory under which per-sandbox cgroups are created");
ABSL_FLAG(std::string, chroot_base, "/srv/codebox",
          "Directory holding the per-sandbox root directories");
ABSL_FLAG(std::string, staging_dir, "/tmp",
          "Where code is written before it is run");

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(
      absl::StrFormat("Runs code in a sandbox.\n"
                      "Usage: %s --language=python|cpp FILE|-",
                      argv[0]));
  std::vector<std::string> args;
  {
    const std::vector<char*> parsed_argv = absl::ParseCommandLine(argc, argv);
    args.assign(parsed_argv.begin() + 1, parsed_argv.end());
  }
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kWarning);
  absl::InitializeLog();

  if (args.size() != 1) {
    absl::FPrintF(stderr, "Expected exactly one FILE argument, or '-'\n");
    return EXIT_FAILURE;
  }

  absl::StatusOr<std::string> code =
      codebox::file::GetContents(args[0] == "-" ? "/dev/stdin" : args[0]);
  if (!code.ok()) {
    absl::FPrintF(stderr, "Cannot read %s: %s\n", args[0],
                  code.status().ToString());
    return EXIT_FAILURE;
  }
  codebox::ExecutionRequest request{*std::move(code)};

  codebox::RecipeOptions options;
  options.ready_timeout = absl::GetFlag(FLAGS_ready_timeout);
  options.staging_dir = absl::GetFlag(FLAGS_staging_dir);
  options.sandbox_options.isolation.cgroup_root =
      absl::GetFlag(FLAGS_cgroup_root);
  options.sandbox_options.isolation.chroot_base =
      absl::GetFlag(FLAGS_chroot_base);

  const std::string isolation = absl::GetFlag(FLAGS_isolation);
  if (isolation.empty()) {
    options.sandbox_options.isolation_level =
        codebox::SettingsFromEnv().isolation_level();
  } else {
    absl::StatusOr<codebox::IsolationLevel> level =
        codebox::ParseIsolationLevel(isolation);
    if (!level.ok()) {
      absl::FPrintF(stderr, "%s\n", level.status().message());
      return EXIT_FAILURE;
    }
    options.sandbox_options.isolation_level = *level;
  }
  VLOG(1) << "Isolation level: "
          << codebox::IsolationLevelName(
                 options.sandbox_options.isolation_level);

  const std::string language = absl::GetFlag(FLAGS_language);
  codebox::ExecutionResponse response;
  if (language == "python") {
    response = codebox::RunPython(request, options);
  } else if (language == "cpp") {
    response = codebox::RunCpp(request, options);
  } else {
    absl::FPrintF(stderr, "Unsupported language: '%s'\n", language);
    return EXIT_FAILURE;
  }

  absl::PrintF("%s\n", response.output);
  if (response.kind != codebox::ResponseKind::kSucceeded) {
    LOG(WARNING) << "Request " << codebox::ResponseKindName(response.kind);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

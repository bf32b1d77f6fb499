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

#include "codebox/runner/staging.h"

#include <cstdint>
#include <string>

#include "absl/log/log.h"
#include "absl/random/bit_gen_ref.h"
#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "codebox/util/file_helpers.h"
#include "codebox/util/fileops.h"
#include "codebox/util/path.h"
#include "codebox/util/status_macros.h"

namespace codebox {

std::string GenerateUuid(absl::BitGenRef gen) {
  uint64_t high = absl::Uniform<uint64_t>(gen);
  uint64_t low = absl::Uniform<uint64_t>(gen);
  // Version 4 in the top nibble of time_hi_and_version, variant 10xx in
  // clock_seq_hi_and_reserved.
  high = (high & ~uint64_t{0xf000}) | uint64_t{0x4000};
  low = (low & ~(uint64_t{0xc} << 60)) | (uint64_t{0x8} << 60);
  return absl::StrFormat("%08x-%04x-%04x-%04x-%012x", high >> 32,
                         (high >> 16) & 0xffff, high & 0xffff, low >> 48,
                         low & 0xffffffffffff);
}

std::string GenerateUuid() {
  absl::BitGen gen;
  return GenerateUuid(gen);
}

absl::StatusOr<std::string> StageSource(absl::string_view dir,
                                        absl::string_view id,
                                        absl::string_view extension,
                                        absl::string_view code) {
  std::string path = file::JoinPath(dir, absl::StrCat(id, extension));
  CODEBOX_RETURN_IF_ERROR(file::SetContents(path, code));
  VLOG(1) << "Staged " << code.size() << " bytes at " << path;
  return path;
}

void RemoveStaged(const std::string& path) {
  if (!file_util::fileops::DeleteRecursively(path)) {
    PLOG(WARNING) << "Could not remove staged file " << path;
  }
}

}  // namespace codebox

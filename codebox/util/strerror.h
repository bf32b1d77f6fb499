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

#ifndef CODEBOX_UTIL_STRERROR_H_
#define CODEBOX_UTIL_STRERROR_H_

#include <cstddef>

namespace codebox {

// Describes errnum without allocating and without touching errno, for use in
// the anchor after fork(). The result is either buf or a static string.
const char* RawStrError(int errnum, char* buf, size_t buflen);

}  // namespace codebox

#endif  // CODEBOX_UTIL_STRERROR_H_

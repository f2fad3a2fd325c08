// Copyright 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#include "textutil/code_points.h"

#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "unicode/uchar.h"
#include "unicode/utf8.h"

namespace textutil {

std::vector<CodePoint> DecodeCodePoints(absl::string_view text) {
  std::vector<CodePoint> code_points;
  code_points.reserve(text.size());
  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
  // The UTF-8 macros only do index arithmetic, so 64-bit offsets cover inputs
  // of any size.
  const int64_t length = static_cast<int64_t>(text.size());
  int64_t offset = 0;
  while (offset < length) {
    const int64_t start = offset;
    UChar32 c;
    U8_NEXT_OR_FFFD(bytes, offset, length, c);
    code_points.push_back(
        CodePoint{c, text.substr(start, offset - start)});
  }
  return code_points;
}

int64_t CountCodePoints(absl::string_view text) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
  const int64_t length = static_cast<int64_t>(text.size());
  int64_t offset = 0;
  int64_t count = 0;
  while (offset < length) {
    U8_FWD_1(bytes, offset, length);
    ++count;
  }
  return count;
}

bool IsValidUtf8(absl::string_view text) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
  const int64_t length = static_cast<int64_t>(text.size());
  int64_t offset = 0;
  while (offset < length) {
    UChar32 c;
    U8_NEXT(bytes, offset, length, c);
    if (c < 0) return false;
  }
  return true;
}

void AppendCodePoint(UChar32 c, std::string& out) {
  char buffer[U8_MAX_LENGTH];
  int32_t length = 0;
  UBool is_error = false;
  U8_APPEND(reinterpret_cast<uint8_t*>(buffer), length, U8_MAX_LENGTH, c,
            is_error);
  if (is_error) {
    // Surrogates and out-of-range values have no UTF-8 encoding.
    out.append("\xEF\xBF\xBD");
    return;
  }
  out.append(buffer, length);
}

bool IsWordCharacter(UChar32 c) {
  return (U_GET_GC_MASK(c) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
}

bool IsWhitespace(UChar32 c) { return u_isUWhiteSpace(c); }

}  // namespace textutil

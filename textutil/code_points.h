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

#ifndef TEXTUTIL_CODE_POINTS_H_
#define TEXTUTIL_CODE_POINTS_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "unicode/umachine.h"

namespace textutil {

// A code point decoded from UTF-8, together with the bytes it was decoded from.
// An ill-formed byte sequence decodes to U+FFFD and `bytes` holds the
// offending bytes unchanged.
struct CodePoint {
  UChar32 value = 0;
  absl::string_view bytes;
};

// Decodes `text` into code points. The returned `bytes` views point into
// `text`, so `text` must outlive the result. Concatenating all `bytes` yields
// `text` again.
std::vector<CodePoint> DecodeCodePoints(absl::string_view text);

// Returns the number of code points in `text`. Every ill-formed sequence counts
// as one code point.
int64_t CountCodePoints(absl::string_view text);

// True if `text` is well-formed UTF-8.
bool IsValidUtf8(absl::string_view text);

// Appends the UTF-8 encoding of `c` to `out`.
void AppendCodePoint(UChar32 c, std::string& out);

// True for Unicode letters (general category L) and numbers (general category
// N). Everything else separates words.
bool IsWordCharacter(UChar32 c);

// True for code points with the Unicode White_Space property.
bool IsWhitespace(UChar32 c);

}  // namespace textutil

#endif  // TEXTUTIL_CODE_POINTS_H_

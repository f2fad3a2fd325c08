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

// Stateless whole-text transforms. All functions accept any input, including
// the empty string, and never fail. Text is treated as UTF-8; ill-formed bytes
// are carried through unchanged wherever a transform does not need to
// interpret them.

#ifndef TEXTUTIL_TRANSFORMS_H_
#define TEXTUTIL_TRANSFORMS_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "re2/re2.h"
#include "textutil/capitalizer.h"

namespace textutil {

// Maps every code point to its simple (1:1) Unicode uppercase or lowercase
// mapping. Locale independent, so e.g. "ß" is left unchanged by ToUpperCase.
std::string ToUpperCase(absl::string_view text);
std::string ToLowerCase(absl::string_view text);

// Applies `capitalizer` to each whitespace-separated word. Whitespace is
// preserved as is.
std::string ToTitleCase(absl::string_view text,
                        const Capitalizer& capitalizer = EnglishCapitalizer());

// Reverses the sequence of code points. Multi-byte code points are kept intact,
// so reversing twice restores well-formed UTF-8. Ill-formed sequences are moved
// as units but may combine with their new neighbours into well-formed ones:
// "\x81\xE3\x81" reverses to "\xE3\x81\x81", a single code point. Callers
// that need the round trip must validate the encoding first.
std::string ReverseText(absl::string_view text);

// Removes leading and trailing Unicode whitespace.
std::string TrimText(absl::string_view text);

// Splits `text` on '\n', keeping empty lines. The empty string is a single
// empty line.
std::vector<absl::string_view> SplitLines(absl::string_view text);

// Replaces every non-overlapping occurrence of `find`, scanning left to right,
// with `replace`. `find` is always a literal string. If `case_sensitive` is
// false, matching ignores case but `replace` is inserted exactly as given.
//
// An empty `find` matches before every code point and at the end of `text`:
//   FindReplace("ab", "", "-", true) == "-a-b-"
std::string FindReplace(absl::string_view text, absl::string_view find,
                        absl::string_view replace, bool case_sensitive);

// Returns a matcher for the literal string `literal`. Regular expression
// metacharacters in `literal` are escaped.
absl::StatusOr<std::unique_ptr<RE2>> CompileLiteralMatcher(
    absl::string_view literal, bool case_sensitive);

// Drops every line that is exactly equal to an earlier line. The remaining
// lines keep their relative order.
std::string RemoveDuplicateLines(absl::string_view text);

// Stable-sorts the lines of `text` by case-insensitive comparison. Lines that
// compare equal keep their input order, in both directions.
std::string SortLines(absl::string_view text, bool ascending);

}  // namespace textutil

#endif  // TEXTUTIL_TRANSFORMS_H_

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

#ifndef TEXTUTIL_TOKENIZE_H_
#define TEXTUTIL_TOKENIZE_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace textutil {

// Splits `text` into words, in the order they appear.
//
// A word is a maximal run of Unicode letters and numbers; every other code
// point separates words and is dropped. Inside a run, a new word starts at
// each uppercase letter whose preceding code point is a lowercase letter, so
// identifiers split at their camelCase humps:
//
//   SplitWords("myVarName123")       == {"my", "Var", "Name123"}
//   SplitWords("  hello, world!  ")  == {"hello", "world"}
//   SplitWords("HTTPServer")         == {"HTTPServer"}
//   SplitWords("!!! ---")            == {}
//
// Case is judged per code point, so non-ASCII humps split too
// ("straßeÜber" -> {"straße", "Über"}). Ill-formed UTF-8 separates words.
std::vector<std::string> SplitWords(absl::string_view text);

}  // namespace textutil

#endif  // TEXTUTIL_TOKENIZE_H_

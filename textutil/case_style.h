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

#ifndef TEXTUTIL_CASE_STYLE_H_
#define TEXTUTIL_CASE_STYLE_H_

#include <ostream>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "textutil/capitalizer.h"

namespace textutil {

// Identifier styles that words can be rendered in. The comments show how the
// words {"my", "var", "name"} are rendered.
enum class CaseStyle {
  kCamel,     // myVarName
  kPascal,    // MyVarName
  kSnake,     // my_var_name
  kKebab,     // my-var-name
  kConstant,  // MY_VAR_NAME
};

// Parses the style names "camelCase", "PascalCase", "snake_case", "kebab-case"
// and "CONSTANT_CASE". Names are matched exactly. Returns InvalidArgument for
// any other name.
absl::StatusOr<CaseStyle> ParseCaseStyle(absl::string_view name);

// Returns the name that ParseCaseStyle accepts for `style`.
absl::string_view CaseStyleName(CaseStyle style);

// All styles, in declaration order.
std::vector<CaseStyle> AllCaseStyles();

std::ostream& operator<<(std::ostream& os, CaseStyle style);

// Joins `words` in the given style. Words are lowercased, except in
// kConstant, where they are uppercased. kCamel capitalizes every word but the
// first and kPascal capitalizes every word, both through `capitalizer`.
// No words render as the empty string.
std::string RenderCase(absl::Span<const std::string> words, CaseStyle style,
                       const Capitalizer& capitalizer = EnglishCapitalizer());

// Splits `text` into words (see SplitWords) and renders them in `style`.
//   ConvertCase("my_var_name123", CaseStyle::kCamel) == "myVarName123"
std::string ConvertCase(absl::string_view text, CaseStyle style,
                        const Capitalizer& capitalizer = EnglishCapitalizer());

// Like above, but takes the style by name. If `style_name` is not a known
// style, `text` is returned unchanged.
std::string ConvertCase(absl::string_view text, absl::string_view style_name,
                        const Capitalizer& capitalizer = EnglishCapitalizer());

}  // namespace textutil

#endif  // TEXTUTIL_CASE_STYLE_H_

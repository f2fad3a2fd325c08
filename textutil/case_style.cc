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
#include "textutil/case_style.h"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "textutil/capitalizer.h"
#include "textutil/status.h"
#include "textutil/tokenize.h"
#include "textutil/transforms.h"

namespace textutil {
namespace {

constexpr std::pair<CaseStyle, absl::string_view> kCaseStyleNames[] = {
    {CaseStyle::kCamel, "camelCase"},
    {CaseStyle::kPascal, "PascalCase"},
    {CaseStyle::kSnake, "snake_case"},
    {CaseStyle::kKebab, "kebab-case"},
    {CaseStyle::kConstant, "CONSTANT_CASE"},
};

std::string JoinMapped(absl::Span<const std::string> words,
                       absl::string_view separator,
                       std::string (*map)(absl::string_view)) {
  return absl::StrJoin(words, separator,
                       [map](std::string* out, const std::string& word) {
                         absl::StrAppend(out, map(word));
                       });
}

}  // namespace

absl::StatusOr<CaseStyle> ParseCaseStyle(absl::string_view name) {
  for (const auto& [style, style_name] : kCaseStyleNames) {
    if (name == style_name) return style;
  }
  return InvalidArgumentErrorBuilder()
         << "unknown case style '" << name << "'; expected one of: "
         << absl::StrJoin(kCaseStyleNames, ", ",
                          [](std::string* out, const auto& entry) {
                            absl::StrAppend(out, entry.second);
                          });
}

absl::string_view CaseStyleName(CaseStyle style) {
  for (const auto& [known_style, name] : kCaseStyleNames) {
    if (known_style == style) return name;
  }
  LOG(DFATAL) << "unexpected CaseStyle: " << static_cast<int>(style);
  return "";
}

std::vector<CaseStyle> AllCaseStyles() {
  std::vector<CaseStyle> styles;
  for (const auto& [style, name] : kCaseStyleNames) styles.push_back(style);
  return styles;
}

std::ostream& operator<<(std::ostream& os, CaseStyle style) {
  return os << CaseStyleName(style);
}

std::string RenderCase(absl::Span<const std::string> words, CaseStyle style,
                       const Capitalizer& capitalizer) {
  switch (style) {
    case CaseStyle::kCamel: {
      if (words.empty()) return "";
      std::string result = ToLowerCase(words.front());
      for (const std::string& word : words.subspan(1)) {
        absl::StrAppend(&result, capitalizer.Capitalize(word));
      }
      return result;
    }
    case CaseStyle::kPascal: {
      std::string result;
      for (const std::string& word : words) {
        absl::StrAppend(&result, capitalizer.Capitalize(word));
      }
      return result;
    }
    case CaseStyle::kSnake:
      return JoinMapped(words, "_", &ToLowerCase);
    case CaseStyle::kKebab:
      return JoinMapped(words, "-", &ToLowerCase);
    case CaseStyle::kConstant:
      return JoinMapped(words, "_", &ToUpperCase);
  }
  LOG(DFATAL) << "exhaustive switch statement failed: "
              << static_cast<int>(style);
  return "";
}

std::string ConvertCase(absl::string_view text, CaseStyle style,
                        const Capitalizer& capitalizer) {
  return RenderCase(SplitWords(text), style, capitalizer);
}

std::string ConvertCase(absl::string_view text, absl::string_view style_name,
                        const Capitalizer& capitalizer) {
  absl::StatusOr<CaseStyle> style = ParseCaseStyle(style_name);
  if (!style.ok()) return std::string(text);
  return ConvertCase(text, *style, capitalizer);
}

}  // namespace textutil

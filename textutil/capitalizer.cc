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
#include "textutil/capitalizer.h"

#include <algorithm>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "textutil/code_points.h"
#include "textutil/transforms.h"
#include "unicode/locid.h"
#include "unicode/stringoptions.h"
#include "unicode/uchar.h"
#include "unicode/unistr.h"

namespace textutil {
namespace {

// Where ICU's default title-case adjustment lands: the first letter, number,
// symbol or private use character.
bool StartsTitle(const CodePoint& code_point) {
  return (U_GET_GC_MASK(code_point.value) &
          (U_GC_L_MASK | U_GC_N_MASK | U_GC_S_MASK | U_GC_CO_MASK)) != 0;
}

}  // namespace

std::string IcuCapitalizer::Capitalize(absl::string_view word) const {
  const std::vector<CodePoint> code_points = DecodeCodePoints(word);
  auto first =
      std::find_if(code_points.begin(), code_points.end(), StartsTitle);
  if (first == code_points.end()) return ToLowerCase(word);

  const size_t title_begin = first->bytes.data() - word.data();
  const size_t title_end = title_begin + first->bytes.size();
  std::string result(word.substr(0, title_begin));

  const icu::UnicodeString original(first->value);
  icu::UnicodeString title = original;
  title.toTitle(/*titleIter=*/nullptr, icu::Locale(locale_id_.c_str()),
                U_TITLECASE_WHOLE_STRING | U_TITLECASE_NO_BREAK_ADJUSTMENT);
  if (title == original) {
    // Also keeps an ill-formed sequence, decoded as U+FFFD, byte for byte.
    result.append(first->bytes.data(), first->bytes.size());
  } else {
    title.toUTF8String(result);
  }
  result.append(ToLowerCase(word.substr(title_end)));
  return result;
}

const Capitalizer& EnglishCapitalizer() {
  static const auto* const kEnglish = new IcuCapitalizer("en");
  return *kEnglish;
}

}  // namespace textutil

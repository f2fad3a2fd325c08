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
#include "textutil/text_stats.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>

#include "absl/algorithm/container.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "textutil/code_points.h"
#include "textutil/transforms.h"

namespace textutil {

namespace {

inline std::tuple<int64_t, int64_t, int64_t, int64_t, int64_t> Tupled(
    const TextStats& s) {
  return std::make_tuple(s.words, s.characters, s.characters_no_spaces,
                         s.lines, s.paragraphs);
}

int64_t CountWords(absl::string_view text) {
  int64_t words = 0;
  bool in_word = false;
  for (const CodePoint& code_point : DecodeCodePoints(text)) {
    const bool is_space = IsWhitespace(code_point.value);
    if (!is_space && !in_word) ++words;
    in_word = !is_space;
  }
  return words;
}

}  // namespace

TextStats ComputeTextStats(absl::string_view text) {
  const std::string trimmed = TrimText(text);
  TextStats stats;
  stats.words = CountWords(trimmed);
  stats.characters = CountCodePoints(trimmed);
  stats.characters_no_spaces = stats.characters - absl::c_count(trimmed, ' ') -
                               absl::c_count(trimmed, '\n');
  stats.lines = absl::c_count(trimmed, '\n') + 1;
  for (absl::string_view paragraph : absl::StrSplit(trimmed, "\n\n")) {
    if (!TrimText(paragraph).empty()) ++stats.paragraphs;
  }
  return stats;
}

std::string TextStatsToString(const TextStats& stats) {
  return absl::StrFormat(
      "words: %d\ncharacters: %d\ncharacters_no_spaces: %d\nlines: %d\n"
      "paragraphs: %d\n",
      stats.words, stats.characters, stats.characters_no_spaces, stats.lines,
      stats.paragraphs);
}

std::ostream& operator<<(std::ostream& os, const TextStats& stats) {
  return os << absl::StrFormat(
             "TextStats{words: %d, characters: %d, characters_no_spaces: %d, "
             "lines: %d, paragraphs: %d}",
             stats.words, stats.characters, stats.characters_no_spaces,
             stats.lines, stats.paragraphs);
}

bool operator==(const TextStats& x, const TextStats& y) {
  return Tupled(x) == Tupled(y);
}
bool operator!=(const TextStats& x, const TextStats& y) {
  return Tupled(x) != Tupled(y);
}

}  // namespace textutil

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

#ifndef TEXTUTIL_TEXT_STATS_H_
#define TEXTUTIL_TEXT_STATS_H_

#include <cstdint>
#include <ostream>
#include <string>

#include "absl/strings/string_view.h"

namespace textutil {

// Size summary of a text, consisting of:
// - `words` - number of whitespace-separated words.
// - `characters` - number of code points.
// - `characters_no_spaces` - same, not counting ' ' and '\n'. Other whitespace
//                            such as tabs is counted.
// - `lines` - number of '\n'-separated lines, including empty ones.
// - `paragraphs` - number of non-blank blocks separated by "\n\n".
struct TextStats {
  int64_t words = 0;
  int64_t characters = 0;
  int64_t characters_no_spaces = 0;
  int64_t lines = 0;
  int64_t paragraphs = 0;
};

// Computes the stats of `text` after trimming leading and trailing whitespace.
// A text that is empty after trimming has one (empty) line and no paragraphs.
TextStats ComputeTextStats(absl::string_view text);

// Returns one "<field>: <value>" line per field, in declaration order, e.g.
//   words: 5
//   characters: 38
//   ...
std::string TextStatsToString(const TextStats& stats);

std::ostream& operator<<(std::ostream& os, const TextStats& stats);

bool operator==(const TextStats& x, const TextStats& y);
bool operator!=(const TextStats& x, const TextStats& y);

}  // namespace textutil

#endif  // TEXTUTIL_TEXT_STATS_H_

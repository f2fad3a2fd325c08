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
#include "textutil/tokenize.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "textutil/code_points.h"
#include "unicode/uchar.h"

namespace textutil {

std::vector<std::string> SplitWords(absl::string_view text) {
  std::vector<std::string> words;
  std::string current_word;
  auto flush = [&]() {
    if (current_word.empty()) return;
    words.push_back(std::move(current_word));
    current_word.clear();
  };

  bool previous_is_lower = false;
  for (const CodePoint& code_point : DecodeCodePoints(text)) {
    if (IsWordCharacter(code_point.value)) {
      // camelCase hump.
      if (previous_is_lower && u_isupper(code_point.value)) flush();
      current_word.append(code_point.bytes.data(), code_point.bytes.size());
    } else {
      flush();
    }
    previous_is_lower = u_islower(code_point.value);
  }
  flush();
  return words;
}

}  // namespace textutil

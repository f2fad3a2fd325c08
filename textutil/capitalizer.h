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

#ifndef TEXTUTIL_CAPITALIZER_H_
#define TEXTUTIL_CAPITALIZER_H_

#include <string>

#include "absl/strings/string_view.h"

namespace textutil {

// Capitalizes a single word according to the casing rules of some language.
// Title case and the camelCase/PascalCase renderers go through this interface,
// so a different language can be plugged in without touching the tokenizer.
class Capitalizer {
 public:
  virtual ~Capitalizer() = default;

  // Returns `word` with its first letter converted to title case and the rest
  // lowercased with the same simple mappings as ToLowerCase(). Leading
  // punctuation is kept as is, but a leading digit counts as the first
  // character:
  // "(hELLO" -> "(Hello", "123ABC" -> "123abc".
  virtual std::string Capitalize(absl::string_view word) const = 0;
};

// Capitalizer backed by ICU's locale-sensitive title casing of the first
// letter, e.g. "tr" turns "istanbul" into "İstanbul" (dotted capital I) where
// "en" gives "Istanbul".
class IcuCapitalizer : public Capitalizer {
 public:
  // `locale_id` is an ICU locale id such as "en", "tr" or "nl_NL".
  explicit IcuCapitalizer(absl::string_view locale_id)
      : locale_id_(locale_id) {}

  std::string Capitalize(absl::string_view word) const override;

  const std::string& locale_id() const { return locale_id_; }

 private:
  std::string locale_id_;
};

// The English capitalizer used when no other capitalizer is given.
const Capitalizer& EnglishCapitalizer();

}  // namespace textutil

#endif  // TEXTUTIL_CAPITALIZER_H_

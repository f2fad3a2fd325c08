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
#include "textutil/transforms.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "re2/re2.h"
#include "textutil/capitalizer.h"
#include "textutil/code_points.h"
#include "textutil/status.h"
#include "unicode/uchar.h"

namespace textutil {
namespace {

// Applies `mapping` to every code point. Code points that map to themselves are
// copied byte for byte, which keeps ill-formed input intact.
template <typename Mapping>
std::string MapCodePoints(absl::string_view text, Mapping mapping) {
  std::string result;
  result.reserve(text.size());
  for (const CodePoint& code_point : DecodeCodePoints(text)) {
    const UChar32 mapped = mapping(code_point.value);
    if (mapped == code_point.value) {
      result.append(code_point.bytes.data(), code_point.bytes.size());
    } else {
      AppendCodePoint(mapped, result);
    }
  }
  return result;
}

// Escapes `replace` so that RE2 inserts it verbatim instead of expanding
// backreferences such as "\1".
std::string LiteralRewrite(absl::string_view replace) {
  return absl::StrReplaceAll(replace, {{"\\", "\\\\"}});
}

// Byte-wise pattern for `literal` in which ASCII letters match either case and
// every other byte matches only itself.
std::string AsciiFoldingPattern(absl::string_view literal) {
  std::string pattern;
  for (char c : literal) {
    if (absl::ascii_isalpha(static_cast<unsigned char>(c))) {
      pattern.push_back('[');
      pattern.push_back(absl::ascii_tolower(static_cast<unsigned char>(c)));
      pattern.push_back(absl::ascii_toupper(static_cast<unsigned char>(c)));
      pattern.push_back(']');
    } else {
      pattern.append(RE2::QuoteMeta(re2::StringPiece(&c, 1)));
    }
  }
  return pattern;
}

std::string InsertAtEveryCodePoint(absl::string_view text,
                                   absl::string_view insertion) {
  std::string result;
  for (const CodePoint& code_point : DecodeCodePoints(text)) {
    absl::StrAppend(&result, insertion, code_point.bytes);
  }
  absl::StrAppend(&result, insertion);
  return result;
}

}  // namespace

std::string ToUpperCase(absl::string_view text) {
  return MapCodePoints(text, [](UChar32 c) { return u_toupper(c); });
}

std::string ToLowerCase(absl::string_view text) {
  return MapCodePoints(text, [](UChar32 c) { return u_tolower(c); });
}

std::string ToTitleCase(absl::string_view text,
                        const Capitalizer& capitalizer) {
  std::string result;
  result.reserve(text.size());
  const std::vector<CodePoint> code_points = DecodeCodePoints(text);
  size_t i = 0;
  while (i < code_points.size()) {
    // The byte range [begin, end) covers a run of whitespace or a run of
    // non-whitespace.
    const bool is_space = IsWhitespace(code_points[i].value);
    const char* begin = code_points[i].bytes.data();
    const char* end = begin;
    while (i < code_points.size() &&
           IsWhitespace(code_points[i].value) == is_space) {
      end = code_points[i].bytes.data() + code_points[i].bytes.size();
      ++i;
    }
    const absl::string_view run(begin, end - begin);
    if (is_space) {
      result.append(run.data(), run.size());
    } else {
      absl::StrAppend(&result, capitalizer.Capitalize(run));
    }
  }
  return result;
}

std::string ReverseText(absl::string_view text) {
  const std::vector<CodePoint> code_points = DecodeCodePoints(text);
  std::string result;
  result.reserve(text.size());
  for (auto it = code_points.rbegin(); it != code_points.rend(); ++it) {
    result.append(it->bytes.data(), it->bytes.size());
  }
  return result;
}

std::string TrimText(absl::string_view text) {
  const std::vector<CodePoint> code_points = DecodeCodePoints(text);
  auto is_not_space = [](const CodePoint& code_point) {
    return !IsWhitespace(code_point.value);
  };
  auto first =
      std::find_if(code_points.begin(), code_points.end(), is_not_space);
  if (first == code_points.end()) return "";
  auto last =
      std::find_if(code_points.rbegin(), code_points.rend(), is_not_space);
  const char* begin = first->bytes.data();
  const char* end = last->bytes.data() + last->bytes.size();
  return std::string(begin, end - begin);
}

std::vector<absl::string_view> SplitLines(absl::string_view text) {
  return absl::StrSplit(text, '\n');
}

absl::StatusOr<std::unique_ptr<RE2>> CompileLiteralMatcher(
    absl::string_view literal, bool case_sensitive) {
  RE2::Options options;
  options.set_case_sensitive(case_sensitive);
  options.set_log_errors(false);
  std::string pattern;
  if (IsValidUtf8(literal)) {
    pattern = RE2::QuoteMeta(re2::StringPiece(literal.data(), literal.size()));
  } else {
    // RE2 rejects ill-formed UTF-8 patterns, so those are matched byte-wise.
    // Latin-1 case folding would pair unrelated UTF-8 bytes (0xC3 and 0xE3),
    // so only ASCII letters fold.
    options.set_encoding(RE2::Options::EncodingLatin1);
    options.set_case_sensitive(true);
    pattern = case_sensitive ? RE2::QuoteMeta(re2::StringPiece(
                                   literal.data(), literal.size()))
                             : AsciiFoldingPattern(literal);
  }
  auto matcher = std::make_unique<RE2>(pattern, options);
  if (!matcher->ok()) {
    return InternalErrorBuilder()
           << "failed to compile matcher for literal '" << literal
           << "': " << matcher->error();
  }
  return matcher;
}

std::string FindReplace(absl::string_view text, absl::string_view find,
                        absl::string_view replace, bool case_sensitive) {
  if (find.empty()) return InsertAtEveryCodePoint(text, replace);
  if (case_sensitive) return absl::StrReplaceAll(text, {{find, replace}});

  absl::StatusOr<std::unique_ptr<RE2>> matcher =
      CompileLiteralMatcher(find, /*case_sensitive=*/false);
  if (!matcher.ok()) {
    LOG(DFATAL) << "SHOULD NEVER HAPPEN: escaped literal did not compile: "
                << matcher.status();
    return std::string(text);
  }
  std::string result(text);
  RE2::GlobalReplace(&result, **matcher, LiteralRewrite(replace));
  return result;
}

std::string RemoveDuplicateLines(absl::string_view text) {
  absl::flat_hash_set<absl::string_view> seen;
  std::vector<absl::string_view> unique_lines;
  for (absl::string_view line : SplitLines(text)) {
    if (seen.insert(line).second) unique_lines.push_back(line);
  }
  return absl::StrJoin(unique_lines, "\n");
}

std::string SortLines(absl::string_view text, bool ascending) {
  // Each line is paired with its lowercased sort key.
  std::vector<std::pair<std::string, absl::string_view>> keyed_lines;
  for (absl::string_view line : SplitLines(text)) {
    keyed_lines.emplace_back(ToLowerCase(line), line);
  }
  std::stable_sort(keyed_lines.begin(), keyed_lines.end(),
                   [ascending](const auto& a, const auto& b) {
                     return ascending ? a.first < b.first : b.first < a.first;
                   });
  return absl::StrJoin(keyed_lines, "\n",
                       [](std::string* out, const auto& keyed_line) {
                         absl::StrAppend(out, keyed_line.second);
                       });
}

}  // namespace textutil

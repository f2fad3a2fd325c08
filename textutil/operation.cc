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
#include "textutil/operation.h"

#include <ostream>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "textutil/case_style.h"
#include "textutil/status.h"
#include "textutil/text_stats.h"
#include "textutil/tokenize.h"
#include "textutil/transforms.h"

namespace textutil {
namespace {

constexpr std::pair<Operation, absl::string_view> kOperationNames[] = {
    {Operation::kUpper, "upper"},
    {Operation::kLower, "lower"},
    {Operation::kTitle, "title"},
    {Operation::kReverse, "reverse"},
    {Operation::kTrim, "trim"},
    {Operation::kStats, "stats"},
    {Operation::kFindReplace, "find_replace"},
    {Operation::kDedup, "dedup"},
    {Operation::kSort, "sort"},
    {Operation::kConvertCase, "convert_case"},
    {Operation::kSplitWords, "split_words"},
};

}  // namespace

absl::StatusOr<Operation> ParseOperation(absl::string_view name) {
  for (const auto& [operation, operation_name] : kOperationNames) {
    if (name == operation_name) return operation;
  }
  return InvalidArgumentErrorBuilder()
         << "unknown operation '" << name << "'; expected one of: "
         << absl::StrJoin(kOperationNames, ", ",
                          [](std::string* out, const auto& entry) {
                            absl::StrAppend(out, entry.second);
                          });
}

absl::string_view OperationName(Operation operation) {
  for (const auto& [known_operation, name] : kOperationNames) {
    if (known_operation == operation) return name;
  }
  LOG(DFATAL) << "unexpected Operation: " << static_cast<int>(operation);
  return "";
}

std::ostream& operator<<(std::ostream& os, Operation operation) {
  return os << OperationName(operation);
}

std::string RunOperation(Operation operation, absl::string_view text,
                         const OperationOptions& options) {
  switch (operation) {
    case Operation::kUpper:
      return ToUpperCase(text);
    case Operation::kLower:
      return ToLowerCase(text);
    case Operation::kTitle:
      return ToTitleCase(text);
    case Operation::kReverse:
      return ReverseText(text);
    case Operation::kTrim:
      return TrimText(text);
    case Operation::kStats:
      return TextStatsToString(ComputeTextStats(text));
    case Operation::kFindReplace:
      return FindReplace(text, options.find, options.replace,
                         options.case_sensitive);
    case Operation::kDedup:
      return RemoveDuplicateLines(text);
    case Operation::kSort:
      return SortLines(text, options.ascending);
    case Operation::kConvertCase:
      if (!ParseCaseStyle(options.style).ok()) {
        LOG(WARNING) << "Unknown case style '" << options.style
                     << "'; returning the text unchanged.";
      }
      return ConvertCase(text, options.style);
    case Operation::kSplitWords:
      return absl::StrJoin(SplitWords(text), "\n");
  }
  LOG(DFATAL) << "exhaustive switch statement failed: "
              << static_cast<int>(operation);
  return std::string(text);
}

}  // namespace textutil

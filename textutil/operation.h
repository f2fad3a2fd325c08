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

// Name-based dispatch over the text operations, for request layers that
// receive the operation as a string (e.g. the `textutil` command line tool).

#ifndef TEXTUTIL_OPERATION_H_
#define TEXTUTIL_OPERATION_H_

#include <ostream>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace textutil {

enum class Operation {
  kUpper,
  kLower,
  kTitle,
  kReverse,
  kTrim,
  kStats,
  kFindReplace,
  kDedup,
  kSort,
  kConvertCase,
  kSplitWords,
};

// Parameters of the operations that take any. Each operation reads only its
// own fields.
struct OperationOptions {
  // kConvertCase. Unknown names leave the text unchanged.
  std::string style;
  // kFindReplace.
  std::string find;
  std::string replace;
  bool case_sensitive = true;
  // kSort.
  bool ascending = true;
};

// Parses "upper", "lower", "title", "reverse", "trim", "stats",
// "find_replace", "dedup", "sort", "convert_case" and "split_words".
absl::StatusOr<Operation> ParseOperation(absl::string_view name);

absl::string_view OperationName(Operation operation);

std::ostream& operator<<(std::ostream& os, Operation operation);

// Applies `operation` to `text`. kStats renders its result with
// TextStatsToString and kSplitWords puts one word per line.
std::string RunOperation(Operation operation, absl::string_view text,
                         const OperationOptions& options);

}  // namespace textutil

#endif  // TEXTUTIL_OPERATION_H_

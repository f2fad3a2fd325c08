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

// Applies one text operation to a file (or stdin) and writes the result to a
// file (or stdout).
//
// Example:
//   echo "myVarName123" | textutil --operation=convert_case --style=snake_case

#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/strings/str_join.h"
#include "textutil/io.h"
#include "textutil/operation.h"
#include "textutil/status.h"

ABSL_FLAG(std::string, operation, "",
          "upper, lower, title, reverse, trim, stats, find_replace, dedup, "
          "sort, convert_case or split_words (required)");
ABSL_FLAG(std::string, input, "", "Input file. Reads stdin if empty.");
ABSL_FLAG(std::string, output, "", "Output file. Writes stdout if empty.");

// Operation parameters.
ABSL_FLAG(std::string, style, "",
          "Target style of convert_case: camelCase, PascalCase, snake_case, "
          "kebab-case or CONSTANT_CASE. Other values leave the text as is.");
ABSL_FLAG(std::string, find, "", "Literal text that find_replace looks for.");
ABSL_FLAG(std::string, replace, "", "Replacement text of find_replace.");
ABSL_FLAG(bool, case_sensitive, true,
          "Whether find_replace matches case sensitively.");
ABSL_FLAG(bool, ascending, true, "Sort order of sort.");

constexpr char kUsage[] =
    "--operation=<operation> [--input=<file>] [--output=<file>] [--style=...] "
    "[--find=... --replace=... --case_sensitive=...] [--ascending=...]";

namespace textutil {
namespace {

absl::Status Main() {
  ASSIGN_OR_RETURN(Operation operation,
                   ParseOperation(absl::GetFlag(FLAGS_operation)));

  std::string text;
  const std::string input = absl::GetFlag(FLAGS_input);
  if (input.empty()) {
    ASSIGN_OR_RETURN(text, ReadStream(std::cin));
  } else {
    ASSIGN_OR_RETURN(text, ReadFile(input));
  }

  OperationOptions options;
  options.style = absl::GetFlag(FLAGS_style);
  options.find = absl::GetFlag(FLAGS_find);
  options.replace = absl::GetFlag(FLAGS_replace);
  options.case_sensitive = absl::GetFlag(FLAGS_case_sensitive);
  options.ascending = absl::GetFlag(FLAGS_ascending);
  const std::string result = RunOperation(operation, text, options);

  const std::string output = absl::GetFlag(FLAGS_output);
  if (output.empty()) {
    std::cout << result;
    return absl::OkStatus();
  }
  return WriteFile(result, output);
}

}  // namespace
}  // namespace textutil

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(
      absl::StrJoin({"usage:", (const char*)argv[0], kUsage}, " "));
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  absl::Status status = textutil::Main();
  if (!status.ok()) {
    std::cerr << status << std::endl;
    return 1;
  }
  return 0;
}

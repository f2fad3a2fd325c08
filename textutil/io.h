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

// Whole-file reads and writes for the command line tool. Content is treated as
// raw bytes; no newline or encoding conversion takes place.

#ifndef TEXTUTIL_IO_H_
#define TEXTUTIL_IO_H_

#include <istream>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace textutil {

// Returns the content of the file at `path`. Errors carry the errno-derived
// code, e.g. NotFound for a missing file.
absl::StatusOr<std::string> ReadFile(const std::string &path);

// Reads `stream` to its end.
absl::StatusOr<std::string> ReadStream(std::istream &stream);

// Replaces the content of the file at `path` with `content`, creating it if
// needed. The parent directory must exist.
absl::Status WriteFile(const std::string &content, const std::string &path);

}  // namespace textutil

#endif  // TEXTUTIL_IO_H_

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
#include "textutil/io.h"

#include <cerrno>
#include <fstream>
#include <istream>
#include <iterator>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "textutil/status.h"

namespace textutil {
namespace {

// Status for a failed file operation, with the code derived from errno
// (ENOENT is NotFound, EACCES is PermissionDenied, ...).
absl::Status FileError(absl::string_view action, const std::string &path) {
  const int error_number = errno;
  if (error_number == 0) {
    return absl::UnknownError(absl::StrCat("cannot ", action, " ", path));
  }
  return absl::ErrnoToStatus(error_number,
                             absl::StrCat("cannot ", action, " ", path));
}

}  // namespace

absl::StatusOr<std::string> ReadFile(const std::string &path) {
  errno = 0;
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return FileError("open", path);
  ASSIGN_OR_RETURN(std::string content, ReadStream(file),
                   _.SetPrepend() << path << ": ");
  return content;
}

absl::StatusOr<std::string> ReadStream(std::istream &stream) {
  std::string content{std::istreambuf_iterator<char>(stream),
                      std::istreambuf_iterator<char>()};
  if (stream.bad()) return UnknownErrorBuilder() << "stream read failed";
  return content;
}

absl::Status WriteFile(const std::string &content, const std::string &path) {
  errno = 0;
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) return FileError("open", path);
  file.write(content.data(), content.size());
  file.close();
  if (file.fail()) return FileError("write", path);
  return absl::OkStatus();
}

}  // namespace textutil

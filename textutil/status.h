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

// Streamed construction of error statuses, and the ASSIGN_OR_RETURN macro.

#ifndef TEXTUTIL_STATUS_H_
#define TEXTUTIL_STATUS_H_

#include <sstream>
#include <string>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace textutil {

// Builds a non-OK status whose message is assembled with `<<`. Converts
// implicitly to absl::Status and absl::StatusOr<T>.
//
// Example:
//   absl::StatusOr<CaseStyle> ParseCaseStyle(absl::string_view name) {
//     ...
//     return InvalidArgumentErrorBuilder() << "unknown case style " << name;
//   }
class ABSL_MUST_USE_RESULT StatusBuilder {
 public:
  explicit StatusBuilder(absl::StatusCode code) : code_(code) {}

  // Annotates an existing error. Streamed text is added after the original
  // message, separated by "; ", unless SetPrepend() is called.
  explicit StatusBuilder(const absl::Status& status)
      : code_(status.code()), original_message_(status.message()) {}

  template <typename T>
  StatusBuilder& operator<<(const T& value) {
    stream_ << value;
    return *this;
  }

  // Places the streamed text directly in front of the original message, with
  // no separator.
  StatusBuilder& SetPrepend() {
    prepend_ = true;
    return *this;
  }

  operator absl::Status() const;
  template <typename T>
  operator absl::StatusOr<T>() const {
    return absl::StatusOr<T>(static_cast<absl::Status>(*this));
  }

 private:
  absl::StatusCode code_;
  std::string original_message_;
  std::ostringstream stream_;
  bool prepend_ = false;
};

class ABSL_MUST_USE_RESULT UnknownErrorBuilder : public StatusBuilder {
 public:
  UnknownErrorBuilder() : StatusBuilder(absl::StatusCode::kUnknown) {}
};
class ABSL_MUST_USE_RESULT InvalidArgumentErrorBuilder : public StatusBuilder {
 public:
  InvalidArgumentErrorBuilder()
      : StatusBuilder(absl::StatusCode::kInvalidArgument) {}
};
class ABSL_MUST_USE_RESULT InternalErrorBuilder : public StatusBuilder {
 public:
  InternalErrorBuilder() : StatusBuilder(absl::StatusCode::kInternal) {}
};

}  // namespace textutil

// Unique local names for the macros below. Not for public use.
#define TEXTUTIL_STATUS_CONCAT_INNER(a, b) a##b
#define TEXTUTIL_STATUS_CONCAT(a, b) TEXTUTIL_STATUS_CONCAT_INNER(a, b)
#define TEXTUTIL_STATUSOR_VAR \
  TEXTUTIL_STATUS_CONCAT(textutil_statusor_, __LINE__)

#define TEXTUTIL_ASSIGN_OR_RETURN_2(dest, expr) \
  auto TEXTUTIL_STATUSOR_VAR = expr;            \
  if (!TEXTUTIL_STATUSOR_VAR.ok()) {            \
    return TEXTUTIL_STATUSOR_VAR.status();      \
  }                                             \
  dest = std::move(TEXTUTIL_STATUSOR_VAR).value()

#define TEXTUTIL_ASSIGN_OR_RETURN_3(dest, expr, builder_expr)    \
  auto TEXTUTIL_STATUSOR_VAR = expr;                             \
  if (!TEXTUTIL_STATUSOR_VAR.ok()) {                             \
    ::textutil::StatusBuilder _(TEXTUTIL_STATUSOR_VAR.status()); \
    return (builder_expr);                                       \
  }                                                              \
  dest = std::move(TEXTUTIL_STATUSOR_VAR).value()

#define TEXTUTIL_ASSIGN_OR_RETURN_PICK(_1, _2, _3, macro, ...) macro

// ASSIGN_OR_RETURN(dest, expr) evaluates `expr`, an absl::StatusOr. On success
// the value is moved into `dest`, which may be a declaration. On failure the
// enclosing function returns the error.
//
// An optional third argument annotates the error through a StatusBuilder named
// `_`:
//   ASSIGN_OR_RETURN(std::string text, ReadFile(path),
//                    _ << "while loading input");
#define ASSIGN_OR_RETURN(...)                                 \
  TEXTUTIL_ASSIGN_OR_RETURN_PICK(__VA_ARGS__,                 \
                                 TEXTUTIL_ASSIGN_OR_RETURN_3, \
                                 TEXTUTIL_ASSIGN_OR_RETURN_2, ) \
  (__VA_ARGS__)

#endif  // TEXTUTIL_STATUS_H_

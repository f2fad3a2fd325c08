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

// gMock matchers and assertion macros for absl::Status and absl::StatusOr.

#ifndef TEXTUTIL_STATUS_MATCHERS_H_
#define TEXTUTIL_STATUS_MATCHERS_H_

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "textutil/status.h"

namespace textutil {
namespace matchers_internal {

inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}

template <typename T>
const absl::Status& GetStatus(const absl::StatusOr<T>& status_or) {
  return status_or.status();
}

}  // namespace matchers_internal

MATCHER(IsOk, negation ? "is not OK" : "is OK") {
  return matchers_internal::GetStatus(arg).ok();
}

MATCHER_P(StatusIs, code,
          absl::StrCat(negation ? "does not have" : "has", " status code ",
                       absl::StatusCodeToString(code))) {
  return matchers_internal::GetStatus(arg).code() == code;
}

// Matches the code, and the message against `message_matcher`, which may be a
// plain string or any std::string matcher.
MATCHER_P2(StatusIs, code, message_matcher,
           absl::StrCat(negation ? "does not have" : "has", " status code ",
                        absl::StatusCodeToString(code), " and a message that ",
                        testing::DescribeMatcher<const std::string&>(
                            message_matcher))) {
  const absl::Status& status = matchers_internal::GetStatus(arg);
  if (status.code() != code) {
    *result_listener << "whose status is " << status;
    return false;
  }
  return testing::ExplainMatchResult(
      message_matcher, std::string(status.message()), result_listener);
}

// Matches an OK absl::StatusOr whose value matches `value_matcher`.
MATCHER_P(IsOkAndHolds, value_matcher,
          absl::StrCat(negation ? "is not OK or holds a value that "
                                : "is OK and holds a value that ",
                       negation ? "does not match" : "matches")) {
  if (!arg.ok()) {
    *result_listener << "whose status is " << arg.status();
    return false;
  }
  return testing::ExplainMatchResult(value_matcher, *arg, result_listener);
}

}  // namespace textutil

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::textutil::IsOk())
#define ASSERT_OK(expression) ASSERT_THAT(expression, ::textutil::IsOk())

// Asserts that `expression`, an absl::StatusOr, is OK and moves its value into
// `lhs`, which may be a declaration.
#define ASSERT_OK_AND_ASSIGN(lhs, expression)                          \
  auto TEXTUTIL_STATUSOR_VAR = expression;                             \
  ASSERT_TRUE(TEXTUTIL_STATUSOR_VAR.ok())                              \
      << #expression << " failed: " << TEXTUTIL_STATUSOR_VAR.status(); \
  lhs = std::move(TEXTUTIL_STATUSOR_VAR).value()

#endif  // TEXTUTIL_STATUS_MATCHERS_H_

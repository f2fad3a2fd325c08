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
#include "textutil/status.h"

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "textutil/status_matchers.h"

namespace textutil {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Not;

absl::StatusOr<int> Half(int value) {
  if (value % 2 != 0) {
    return InvalidArgumentErrorBuilder() << value << " is odd";
  }
  return value / 2;
}

absl::StatusOr<int> Quarter(int value) {
  ASSIGN_OR_RETURN(int half, Half(value));
  ASSIGN_OR_RETURN(int quarter, Half(half), _ << "while halving " << half);
  return quarter;
}

absl::StatusOr<int> QuarterWithPrefix(int value) {
  ASSIGN_OR_RETURN(int quarter, Quarter(value),
                   _.SetPrepend() << "quarter of " << value << ": ");
  return quarter;
}

absl::Status CheckQuarter(int value, int expected) {
  int quarter = 0;
  ASSIGN_OR_RETURN(quarter, Quarter(value));
  if (quarter != expected) return InternalErrorBuilder() << "got " << quarter;
  return absl::OkStatus();
}

TEST(StatusBuilderTest, BuildsErrorWithStreamedMessage) {
  absl::Status status = InvalidArgumentErrorBuilder() << "bad " << 42;
  EXPECT_EQ(status, absl::InvalidArgumentError("bad 42"));
  EXPECT_THAT(absl::Status(UnknownErrorBuilder() << "x"),
              StatusIs(absl::StatusCode::kUnknown, "x"));
}

TEST(StatusBuilderTest, AnnotatesExistingMessage) {
  absl::Status status =
      StatusBuilder(absl::NotFoundError("no such file")) << "while reading";
  EXPECT_EQ(status, absl::NotFoundError("no such file; while reading"));
}

TEST(StatusBuilderTest, EmptyPartsAddNoSeparator) {
  EXPECT_EQ(absl::Status(StatusBuilder(absl::NotFoundError("gone"))),
            absl::NotFoundError("gone"));
  EXPECT_EQ(absl::Status(StatusBuilder(absl::NotFoundError("")) << "gone"),
            absl::NotFoundError("gone"));
}

TEST(StatusBuilderTest, PrependsWithoutSeparator) {
  absl::Status status = StatusBuilder(absl::NotFoundError("no such file"))
                            .SetPrepend()
                        << "input.txt: ";
  EXPECT_EQ(status, absl::NotFoundError("input.txt: no such file"));
}

TEST(StatusBuilderTest, ConvertsToStatusOr) {
  absl::StatusOr<std::string> result = InternalErrorBuilder() << "broken";
  EXPECT_THAT(result, StatusIs(absl::StatusCode::kInternal, "broken"));
}

TEST(AssignOrReturnTest, PropagatesValue) {
  EXPECT_THAT(Quarter(12), IsOkAndHolds(3));
  EXPECT_OK(CheckQuarter(8, 2));
}

TEST(AssignOrReturnTest, PropagatesError) {
  EXPECT_THAT(Quarter(7),
              StatusIs(absl::StatusCode::kInvalidArgument, "7 is odd"));
  EXPECT_THAT(CheckQuarter(7, 0),
              StatusIs(absl::StatusCode::kInvalidArgument, "7 is odd"));
}

TEST(AssignOrReturnTest, AnnotatesError) {
  EXPECT_THAT(Quarter(6), StatusIs(absl::StatusCode::kInvalidArgument,
                                   "3 is odd; while halving 3"));
  EXPECT_THAT(QuarterWithPrefix(7),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "quarter of 7: 7 is odd"));
}

TEST(StatusMatchersTest, IsOk) {
  EXPECT_THAT(absl::OkStatus(), IsOk());
  EXPECT_THAT(absl::UnknownError("unknown error"), Not(IsOk()));
  EXPECT_THAT(absl::StatusOr<int>(1), IsOk());
}

TEST(StatusMatchersTest, StatusIs) {
  EXPECT_THAT(absl::UnknownError("unknown error"),
              StatusIs(absl::StatusCode::kUnknown));
  EXPECT_THAT(absl::UnknownError("unknown error"),
              StatusIs(absl::StatusCode::kUnknown, HasSubstr("error")));
  EXPECT_THAT(absl::UnknownError("unknown error"),
              Not(StatusIs(absl::StatusCode::kInvalidArgument, "unknown")));
}

TEST(StatusMatchersTest, IsOkAndHolds) {
  EXPECT_THAT(absl::StatusOr<std::string>("text"), IsOkAndHolds(Eq("text")));
  EXPECT_THAT(absl::StatusOr<int>(absl::InternalError("")),
              Not(IsOkAndHolds(0)));
}

TEST(StatusMatchersTest, AssertOkAndAssignWorksWithMoveOnlyTypes) {
  ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<int> value,
      absl::StatusOr<std::unique_ptr<int>>(std::make_unique<int>(5)));
  EXPECT_EQ(*value, 5);
}

}  // namespace
}  // namespace textutil

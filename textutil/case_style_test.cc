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
#include "textutil/case_style.h"

#include <sstream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "textutil/capitalizer.h"
#include "textutil/status_matchers.h"
#include "textutil/tokenize.h"

namespace textutil {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;

// Capitalizer that marks each word, to observe where capitalization happens.
class BracketCapitalizer : public Capitalizer {
 public:
  std::string Capitalize(absl::string_view word) const override {
    return absl::StrCat("[", word, "]");
  }
};

TEST(ParseCaseStyleTest, PositiveExamples) {
  EXPECT_THAT(ParseCaseStyle("camelCase"), IsOkAndHolds(Eq(CaseStyle::kCamel)));
  EXPECT_THAT(ParseCaseStyle("PascalCase"),
              IsOkAndHolds(Eq(CaseStyle::kPascal)));
  EXPECT_THAT(ParseCaseStyle("snake_case"),
              IsOkAndHolds(Eq(CaseStyle::kSnake)));
  EXPECT_THAT(ParseCaseStyle("kebab-case"),
              IsOkAndHolds(Eq(CaseStyle::kKebab)));
  EXPECT_THAT(ParseCaseStyle("CONSTANT_CASE"),
              IsOkAndHolds(Eq(CaseStyle::kConstant)));
}

TEST(ParseCaseStyleTest, NegativeExamples) {
  EXPECT_THAT(ParseCaseStyle(""), StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ParseCaseStyle("camelcase"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ParseCaseStyle("snake"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ParseCaseStyle(" snake_case"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ParseCaseStyle("unknown-style"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("unknown case style 'unknown-style'")));
}

TEST(CaseStyleTest, NameAndParseRoundTrip) {
  for (CaseStyle style : AllCaseStyles()) {
    EXPECT_THAT(ParseCaseStyle(CaseStyleName(style)), IsOkAndHolds(Eq(style)))
        << style;
  }
}

TEST(CaseStyleTest, StreamsName) {
  std::ostringstream oss;
  oss << CaseStyle::kKebab;
  EXPECT_EQ(oss.str(), "kebab-case");
}

TEST(CaseStyleTest, AllCaseStylesListsEveryStyleOnce) {
  EXPECT_THAT(AllCaseStyles(),
              ElementsAre(CaseStyle::kCamel, CaseStyle::kPascal,
                          CaseStyle::kSnake, CaseStyle::kKebab,
                          CaseStyle::kConstant));
}

TEST(RenderCaseTest, RendersEachStyle) {
  const std::vector<std::string> words = {"my", "Var", "NAME123"};
  EXPECT_EQ(RenderCase(words, CaseStyle::kCamel), "myVarName123");
  EXPECT_EQ(RenderCase(words, CaseStyle::kPascal), "MyVarName123");
  EXPECT_EQ(RenderCase(words, CaseStyle::kSnake), "my_var_name123");
  EXPECT_EQ(RenderCase(words, CaseStyle::kKebab), "my-var-name123");
  EXPECT_EQ(RenderCase(words, CaseStyle::kConstant), "MY_VAR_NAME123");
}

TEST(RenderCaseTest, NoWordsRenderEmpty) {
  for (CaseStyle style : AllCaseStyles()) {
    EXPECT_EQ(RenderCase({}, style), "") << style;
  }
}

TEST(RenderCaseTest, SingleWord) {
  const std::vector<std::string> words = {"hELLO"};
  EXPECT_EQ(RenderCase(words, CaseStyle::kCamel), "hello");
  EXPECT_EQ(RenderCase(words, CaseStyle::kPascal), "Hello");
  EXPECT_EQ(RenderCase(words, CaseStyle::kSnake), "hello");
  EXPECT_EQ(RenderCase(words, CaseStyle::kKebab), "hello");
  EXPECT_EQ(RenderCase(words, CaseStyle::kConstant), "HELLO");
}

TEST(RenderCaseTest, CamelCaseLowercasesFirstWordWithoutCapitalizer) {
  const std::vector<std::string> words = {"One", "two", "three"};
  BracketCapitalizer capitalizer;
  EXPECT_EQ(RenderCase(words, CaseStyle::kCamel, capitalizer),
            "one[two][three]");
  EXPECT_EQ(RenderCase(words, CaseStyle::kPascal, capitalizer),
            "[One][two][three]");
  // Separated styles never capitalize.
  EXPECT_EQ(RenderCase(words, CaseStyle::kSnake, capitalizer),
            "one_two_three");
}

TEST(RenderCaseTest, WordsStartingWithDigitsAreNotCapitalized) {
  const std::vector<std::string> words = {"version", "2beta"};
  EXPECT_EQ(RenderCase(words, CaseStyle::kCamel), "version2beta");
  EXPECT_EQ(RenderCase(words, CaseStyle::kPascal), "Version2beta");
}

TEST(RenderCaseTest, NonAsciiWords) {
  const std::vector<std::string> words = {"ÉCOLE", "über"};
  EXPECT_EQ(RenderCase(words, CaseStyle::kCamel), "écoleÜber");
  EXPECT_EQ(RenderCase(words, CaseStyle::kConstant), "ÉCOLE_ÜBER");
  EXPECT_EQ(RenderCase(words, CaseStyle::kKebab), "école-über");
}

TEST(ConvertCaseTest, ConvertsFreeText) {
  EXPECT_EQ(ConvertCase("hello world, again!", CaseStyle::kCamel),
            "helloWorldAgain");
  EXPECT_EQ(ConvertCase("hello world, again!", CaseStyle::kPascal),
            "HelloWorldAgain");
  EXPECT_EQ(ConvertCase("hello world, again!", CaseStyle::kSnake),
            "hello_world_again");
  EXPECT_EQ(ConvertCase("hello world, again!", CaseStyle::kKebab),
            "hello-world-again");
  EXPECT_EQ(ConvertCase("hello world, again!", CaseStyle::kConstant),
            "HELLO_WORLD_AGAIN");
}

TEST(ConvertCaseTest, ConvertsBetweenIdentifierStyles) {
  EXPECT_EQ(ConvertCase("myVarName", CaseStyle::kSnake), "my_var_name");
  EXPECT_EQ(ConvertCase("MY_VAR_NAME", CaseStyle::kCamel), "myVarName");
  EXPECT_EQ(ConvertCase("my-var-name", CaseStyle::kPascal), "MyVarName");
  EXPECT_EQ(ConvertCase("MyVarName", CaseStyle::kConstant), "MY_VAR_NAME");
}

TEST(ConvertCaseTest, SnakeCaseRoundTripsThroughCamelCase) {
  EXPECT_THAT(SplitWords("myVarName123"), ElementsAre("my", "Var", "Name123"));
  const std::string snake = ConvertCase("myVarName123", CaseStyle::kSnake);
  EXPECT_EQ(snake, "my_var_name123");
  EXPECT_EQ(ConvertCase(snake, CaseStyle::kCamel), "myVarName123");
}

TEST(ConvertCaseTest, StylesLowercaseWordsTheSameWay) {
  EXPECT_EQ(ConvertCase("ΣΑΣ ΣΑΣ", CaseStyle::kCamel), "σασΣασ");
  EXPECT_EQ(ConvertCase("ΣΑΣ ΣΑΣ", CaseStyle::kPascal), "ΣασΣασ");
  EXPECT_EQ(ConvertCase("ΣΑΣ ΣΑΣ", CaseStyle::kSnake), "σασ_σασ");
  for (absl::string_view text : {"ΣΑΣ ΣΑΣ", "İLK İSİM", "myVarName"}) {
    const std::string snake = ConvertCase(text, CaseStyle::kSnake);
    for (CaseStyle style : AllCaseStyles()) {
      EXPECT_EQ(ConvertCase(ConvertCase(text, style), CaseStyle::kSnake), snake)
          << text << " via " << style;
    }
  }
}

TEST(ConvertCaseTest, SeparatorOnlyInputConvertsToEmpty) {
  for (CaseStyle style : AllCaseStyles()) {
    EXPECT_EQ(ConvertCase("!!!   ---", style), "") << style;
    EXPECT_EQ(ConvertCase("", style), "") << style;
  }
}

TEST(ConvertCaseTest, ByName) {
  EXPECT_EQ(ConvertCase("myVarName", "snake_case"), "my_var_name");
  EXPECT_EQ(ConvertCase("my var name", "camelCase"), "myVarName");
  EXPECT_EQ(ConvertCase("my var name", "PascalCase"), "MyVarName");
  EXPECT_EQ(ConvertCase("my var name", "kebab-case"), "my-var-name");
  EXPECT_EQ(ConvertCase("my var name", "CONSTANT_CASE"), "MY_VAR_NAME");
}

TEST(ConvertCaseTest, UnknownStyleNameIsIdentity) {
  EXPECT_EQ(ConvertCase("abc", "unknown-style"), "abc");
  EXPECT_EQ(ConvertCase("my Var  name!", ""), "my Var  name!");
  EXPECT_EQ(ConvertCase("", "snake"), "");
}

TEST(ConvertCaseTest, UsesGivenCapitalizer) {
  const IcuCapitalizer turkish("tr");
  EXPECT_EQ(ConvertCase("ilk isim", CaseStyle::kPascal, turkish), "İlkİsim");
  EXPECT_EQ(ConvertCase("ilk isim", CaseStyle::kPascal), "IlkIsim");
}

}  // namespace
}  // namespace textutil

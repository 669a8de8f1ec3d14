// Copyright 2010-2021, Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
//     * Redistributions of source code must retain the above copyright
// notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above
// copyright notice, this list of conditions and the following disclaimer
// in the documentation and/or other materials provided with the
// distribution.
//     * Neither the name of Google Inc. nor the names of its
// contributors may be used to endorse or promote products derived from
// this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "kansuji/keta_parser.h"

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "base/strings/utf8_cursor.h"
#include "kansuji/digit.h"
#include "kansuji/keta.h"
#include "kansuji/parse_error.h"
#include "testing/gunit.h"

namespace kansuji {
namespace {

Keta MakeKeta(Digit thousands, Digit hundreds, Digit tens, Digit units) {
  Keta keta;
  keta.thousands = thousands;
  keta.hundreds = hundreds;
  keta.tens = tens;
  keta.units = units;
  return keta;
}

constexpr Digit k0 = Digit::kZero;
constexpr Digit k1 = Digit::kOne;
constexpr Digit k2 = Digit::kTwo;
constexpr Digit k3 = Digit::kThree;

TEST(KetaParserTest, HundredThirtyOne) {
  strings::Utf8Cursor cursor("百三十一");
  const absl::StatusOr<KetaParseResult> result = KetaParser::Parse(&cursor);
  ASSERT_OK(result);
  EXPECT_EQ(result->keta, MakeKeta(k0, k1, k3, k1));
  EXPECT_EQ(result->consumed_chars, 4);
  EXPECT_EQ(result->consumed_place_markers, 2);
  EXPECT_TRUE(cursor.Done());
}

TEST(KetaParserTest, Empty) {
  strings::Utf8Cursor cursor("");
  const absl::StatusOr<KetaParseResult> result = KetaParser::Parse(&cursor);
  ASSERT_OK(result);
  EXPECT_TRUE(result->keta.IsZero());
  EXPECT_TRUE(result->empty());
}

TEST(KetaParserTest, StopsInFrontOfMagnitudeMarker) {
  strings::Utf8Cursor cursor("百万一");
  absl::StatusOr<KetaParseResult> result = KetaParser::Parse(&cursor);
  ASSERT_OK(result);
  EXPECT_EQ(result->keta, MakeKeta(k0, k1, k0, k0));
  ASSERT_FALSE(cursor.Done());
  EXPECT_EQ(cursor.Get(), U'万');

  cursor.Next();
  result = KetaParser::Parse(&cursor);
  ASSERT_OK(result);
  EXPECT_EQ(result->keta, MakeKeta(k0, k0, k0, k1));
  EXPECT_EQ(result->consumed_place_markers, 0);
  EXPECT_TRUE(cursor.Done());
}

TEST(KetaParserTest, UnitsBeforeMagnitudeMarker) {
  strings::Utf8Cursor cursor("百二万一");
  absl::StatusOr<KetaParseResult> result = KetaParser::Parse(&cursor);
  ASSERT_OK(result);
  EXPECT_EQ(result->keta, MakeKeta(k0, k1, k0, k2));

  cursor.Next();
  result = KetaParser::Parse(&cursor);
  ASSERT_OK(result);
  EXPECT_EQ(result->keta, MakeKeta(k0, k0, k0, k1));
}

TEST(KetaParserTest, StopsInFrontOfEveryTerminator) {
  for (const char32_t terminator :
       {U'万', U'億', U'兆', U'京', U'垓', U'分', U'厘', U'毛'}) {
    EXPECT_TRUE(KetaParser::IsGroupTerminator(terminator));
    const std::string input =
        absl::StrCat("三", strings::Char32ToUtf8(terminator));
    strings::Utf8Cursor cursor(input);
    const absl::StatusOr<KetaParseResult> result = KetaParser::Parse(&cursor);
    ASSERT_OK(result);
    EXPECT_EQ(result->keta, MakeKeta(k0, k0, k0, k3));
    EXPECT_EQ(cursor.Get(), terminator);
  }
  EXPECT_FALSE(KetaParser::IsGroupTerminator(U'十'));
  EXPECT_FALSE(KetaParser::IsGroupTerminator(U'一'));
}

TEST(KetaParserTest, InvalidGlyph) {
  strings::Utf8Cursor cursor("百に万一");
  const absl::StatusOr<KetaParseResult> result = KetaParser::Parse(&cursor);
  EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(GetUnexpectedChar(result.status()), U'に');
  EXPECT_EQ(cursor.Get(), U'に');
}

TEST(KetaParserTest, PlaceMarkersOutOfOrder) {
  {
    strings::Utf8Cursor cursor("十百");
    EXPECT_EQ(GetUnexpectedChar(KetaParser::Parse(&cursor).status()), U'百');
  }
  {
    strings::Utf8Cursor cursor("二百三百");
    EXPECT_EQ(GetUnexpectedChar(KetaParser::Parse(&cursor).status()), U'百');
  }
  {
    strings::Utf8Cursor cursor("千千");
    EXPECT_EQ(GetUnexpectedChar(KetaParser::Parse(&cursor).status()), U'千');
  }
}

TEST(KetaParserTest, ImplicitOne) {
  strings::Utf8Cursor cursor("千百十");
  const absl::StatusOr<KetaParseResult> result = KetaParser::Parse(&cursor);
  ASSERT_OK(result);
  EXPECT_EQ(result->keta, MakeKeta(k1, k1, k1, k0));
  EXPECT_EQ(result->keta.ToInt(), 1110);
}

TEST(KetaParserTest, LastDigitWins) {
  strings::Utf8Cursor cursor("二三百四五");
  const absl::StatusOr<KetaParseResult> result = KetaParser::Parse(&cursor);
  ASSERT_OK(result);
  EXPECT_EQ(result->keta.ToInt(), 305);
}

TEST(KetaParserTest, UnknownCharPolicy) {
  strings::Utf8Cursor cursor("二十円");
  const absl::StatusOr<KetaParseResult> result =
      KetaParser::Parse(&cursor, KetaParser::UnknownCharPolicy::kStop);
  ASSERT_OK(result);
  EXPECT_EQ(result->keta.ToInt(), 20);
  EXPECT_EQ(result->consumed_chars, 2);
  EXPECT_EQ(cursor.rest(), "円");
}

}  // namespace
}  // namespace kansuji

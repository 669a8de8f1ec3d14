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

#include "kansuji/kansuji.h"

#include <optional>

#include "kansuji/digit.h"
#include "kansuji/keta.h"
#include "testing/gunit.h"

namespace kansuji {
namespace {

TEST(KansujiTest, Markers) {
  EXPECT_EQ(MagnitudeMarker(Magnitude::kGai), "垓");
  EXPECT_EQ(MagnitudeMarker(Magnitude::kKei), "京");
  EXPECT_EQ(MagnitudeMarker(Magnitude::kCho), "兆");
  EXPECT_EQ(MagnitudeMarker(Magnitude::kOku), "億");
  EXPECT_EQ(MagnitudeMarker(Magnitude::kMan), "万");
  EXPECT_EQ(MagnitudeMarker(Magnitude::kBase), "");

  EXPECT_EQ(FractionalMarker(FractionalPlace::kBu), "分");
  EXPECT_EQ(FractionalMarker(FractionalPlace::kRin), "厘");
  EXPECT_EQ(FractionalMarker(FractionalPlace::kMou), "毛");

  EXPECT_EQ(MagnitudeFromMarker(U'垓'), Magnitude::kGai);
  EXPECT_EQ(MagnitudeFromMarker(U'万'), Magnitude::kMan);
  EXPECT_EQ(MagnitudeFromMarker(U'萬'), std::nullopt);
  EXPECT_EQ(MagnitudeFromMarker(U'分'), std::nullopt);

  EXPECT_EQ(FractionalPlaceFromMarker(U'分'), FractionalPlace::kBu);
  EXPECT_EQ(FractionalPlaceFromMarker(U'厘'), FractionalPlace::kRin);
  EXPECT_EQ(FractionalPlaceFromMarker(U'毛'), FractionalPlace::kMou);
  EXPECT_EQ(FractionalPlaceFromMarker(U'万'), std::nullopt);
}

TEST(KansujiTest, MagnitudeLevels) {
  constexpr char32_t kMarkers[] = {U'垓', U'京', U'兆', U'億', U'万'};
  int level = static_cast<int>(Magnitude::kGai);
  for (const char32_t marker : kMarkers) {
    const std::optional<Magnitude> magnitude = MagnitudeFromMarker(marker);
    ASSERT_TRUE(magnitude.has_value());
    EXPECT_EQ(static_cast<int>(*magnitude), level);
    --level;
  }
  EXPECT_EQ(kMagnitudes[0], Magnitude::kGai);
  EXPECT_EQ(kMagnitudes[kNumMagnitudes - 1], Magnitude::kBase);
}

TEST(KansujiTest, DefaultIsZero) {
  const Kansuji kansuji;
  EXPECT_TRUE(kansuji.IsZero());
  EXPECT_FALSE(kansuji.HasFraction());
  EXPECT_EQ(kansuji.FractionInThousandths(), 0);
  for (const Magnitude magnitude : kMagnitudes) {
    EXPECT_TRUE(kansuji.group(magnitude).IsZero());
  }
  for (const FractionalPlace place : kFractionalPlaces) {
    EXPECT_EQ(kansuji.fraction(place), Digit::kZero);
  }
}

TEST(KansujiTest, Accessors) {
  Kansuji kansuji;
  kansuji.set_group(Magnitude::kOku, Keta::FromInt(1234));
  kansuji.set_fraction(FractionalPlace::kRin, Digit::kFive);

  EXPECT_EQ(kansuji.group(Magnitude::kOku).ToInt(), 1234);
  EXPECT_TRUE(kansuji.group(Magnitude::kMan).IsZero());
  EXPECT_EQ(kansuji.fraction(FractionalPlace::kRin), Digit::kFive);
  EXPECT_EQ(kansuji.fraction(FractionalPlace::kBu), Digit::kZero);
  EXPECT_EQ(kansuji.FractionInThousandths(), 50);
  EXPECT_FALSE(kansuji.IsZero());
  EXPECT_TRUE(kansuji.HasFraction());
}

TEST(KansujiTest, FractionOnlyIsNotZero) {
  Kansuji kansuji;
  kansuji.set_fraction(FractionalPlace::kMou, Digit::kOne);
  EXPECT_FALSE(kansuji.IsZero());
  EXPECT_EQ(kansuji.FractionInThousandths(), 1);
}

TEST(KansujiTest, Equality) {
  Kansuji a;
  Kansuji b;
  EXPECT_EQ(a, b);
  a.set_group(Magnitude::kBase, Keta::FromInt(7));
  EXPECT_NE(a, b);
  b.set_group(Magnitude::kBase, Keta::FromInt(7));
  EXPECT_EQ(a, b);
  b.set_fraction(FractionalPlace::kBu, Digit::kOne);
  EXPECT_NE(a, b);

  // Copies are independent.
  Kansuji c = a;
  c.set_group(Magnitude::kMan, Keta::FromInt(1));
  EXPECT_TRUE(a.group(Magnitude::kMan).IsZero());
}

TEST(KansujiTest, Print) {
  Kansuji kansuji;
  kansuji.set_group(Magnitude::kMan, Keta::FromInt(100));
  kansuji.set_group(Magnitude::kBase, Keta::FromInt(1));
  EXPECT_EQ(::testing::PrintToString(kansuji), "百万一");
  EXPECT_EQ(::testing::PrintToString(Kansuji()), "零");
}

}  // namespace
}  // namespace kansuji

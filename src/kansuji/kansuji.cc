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
#include <ostream>

#include "absl/algorithm/container.h"
#include "absl/strings/string_view.h"
#include "kansuji/digit.h"
#include "kansuji/kansuji_formatter.h"
#include "kansuji/keta.h"

namespace kansuji {
namespace {

// Indexed by Magnitude.
constexpr absl::string_view kMagnitudeMarkers[kNumMagnitudes] = {
    "", "万", "億", "兆", "京", "垓"};

// Indexed by -FractionalPlace - 1.
constexpr absl::string_view kFractionalMarkers[kNumFractionalPlaces] = {
    "分", "厘", "毛"};

}  // namespace

absl::string_view MagnitudeMarker(const Magnitude magnitude) {
  return kMagnitudeMarkers[static_cast<int>(magnitude)];
}

absl::string_view FractionalMarker(const FractionalPlace place) {
  return kFractionalMarkers[-static_cast<int>(place) - 1];
}

std::optional<Magnitude> MagnitudeFromMarker(const char32_t c) {
  switch (c) {
    case U'垓':
      return Magnitude::kGai;
    case U'京':
      return Magnitude::kKei;
    case U'兆':
      return Magnitude::kCho;
    case U'億':
      return Magnitude::kOku;
    case U'万':
      return Magnitude::kMan;
    default:
      return std::nullopt;
  }
}

std::optional<FractionalPlace> FractionalPlaceFromMarker(const char32_t c) {
  switch (c) {
    case U'分':
      return FractionalPlace::kBu;
    case U'厘':
      return FractionalPlace::kRin;
    case U'毛':
      return FractionalPlace::kMou;
    default:
      return std::nullopt;
  }
}

bool Kansuji::IsZero() const {
  return absl::c_all_of(groups_,
                        [](const Keta& keta) { return keta.IsZero(); }) &&
         !HasFraction();
}

bool Kansuji::HasFraction() const {
  return absl::c_any_of(fractions_,
                        [](Digit digit) { return digit != Digit::kZero; });
}

int Kansuji::FractionInThousandths() const {
  return DigitToValue(fraction(FractionalPlace::kBu)) * 100 +
         DigitToValue(fraction(FractionalPlace::kRin)) * 10 +
         DigitToValue(fraction(FractionalPlace::kMou));
}

std::ostream& operator<<(std::ostream& os, const Kansuji& kansuji) {
  return os << KansujiFormatter::Format(kansuji);
}

}  // namespace kansuji

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

#ifndef KANSUJI_KANSUJI_KANSUJI_H_
#define KANSUJI_KANSUJI_KANSUJI_H_

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>

#include "absl/strings/string_view.h"
#include "kansuji/digit.h"
#include "kansuji/keta.h"

namespace kansuji {

// Magnitudes of the four-digit groups. The value is the parser level of the
// marker; the group is scaled by 10^(4 * level).
enum class Magnitude : int8_t {
  kBase = 0,
  kMan = 1,  // 万, 10^4
  kOku = 2,  // 億, 10^8
  kCho = 3,  // 兆, 10^12
  kKei = 4,  // 京, 10^16
  kGai = 5,  // 垓, 10^20
};

inline constexpr int kNumMagnitudes = 6;

// From the most significant to the least.
inline constexpr Magnitude kMagnitudes[kNumMagnitudes] = {
    Magnitude::kGai, Magnitude::kKei, Magnitude::kCho,
    Magnitude::kOku, Magnitude::kMan, Magnitude::kBase,
};

// Fractional places. The value is the parser level of the marker, which is
// also the power of ten the digit is scaled by.
enum class FractionalPlace : int8_t {
  kBu = -1,   // 分, 10^-1
  kRin = -2,  // 厘, 10^-2
  kMou = -3,  // 毛, 10^-3
};

inline constexpr int kNumFractionalPlaces = 3;

inline constexpr FractionalPlace kFractionalPlaces[kNumFractionalPlaces] = {
    FractionalPlace::kBu, FractionalPlace::kRin, FractionalPlace::kMou};

// Returns "垓", "京", "兆", "億", "万", or "" for the base group.
absl::string_view MagnitudeMarker(Magnitude magnitude);

// Returns "分", "厘" or "毛".
absl::string_view FractionalMarker(FractionalPlace place);

// Returns the magnitude marked by |c|, or nullopt if |c| is not a magnitude
// marker.
std::optional<Magnitude> MagnitudeFromMarker(char32_t c);

// Returns the fractional place marked by |c|, or nullopt if |c| is not a
// fractional marker.
std::optional<FractionalPlace> FractionalPlaceFromMarker(char32_t c);

// A number written in Japanese numerals between 0 and 10^24 - 0.001: six
// four-digit groups from 垓 down to the base group and three fractional
// digits 分, 厘 and 毛.
//
// This is a plain value type; copy it freely.
class Kansuji {
 public:
  Kansuji() = default;

  const Keta& group(Magnitude magnitude) const {
    return groups_[static_cast<int>(magnitude)];
  }
  void set_group(Magnitude magnitude, const Keta& keta) {
    groups_[static_cast<int>(magnitude)] = keta;
  }

  Digit fraction(FractionalPlace place) const {
    return fractions_[FractionIndex(place)];
  }
  void set_fraction(FractionalPlace place, Digit digit) {
    fractions_[FractionIndex(place)] = digit;
  }

  // Returns true if all groups and fractional digits are zero.
  bool IsZero() const;

  // Returns true if any fractional digit is non-zero.
  bool HasFraction() const;

  // Returns 100 * 分 + 10 * 厘 + 毛, the fraction in thousandths.
  int FractionInThousandths() const;

  friend bool operator==(const Kansuji& lhs, const Kansuji& rhs) = default;

 private:
  static int FractionIndex(FractionalPlace place) {
    return -static_cast<int>(place) - 1;
  }

  // Indexed by Magnitude.
  std::array<Keta, kNumMagnitudes> groups_ = {};
  // Indexed by FractionIndex().
  std::array<Digit, kNumFractionalPlaces> fractions_ = {
      Digit::kZero, Digit::kZero, Digit::kZero};
};

// Writes the canonical form, e.g. "二百五垓百万二十一".
std::ostream& operator<<(std::ostream& os, const Kansuji& kansuji);

}  // namespace kansuji

#endif  // KANSUJI_KANSUJI_KANSUJI_H_

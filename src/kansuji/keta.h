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

#ifndef KANSUJI_KANSUJI_KETA_H_
#define KANSUJI_KANSUJI_KETA_H_

#include <cstdint>
#include <optional>
#include <ostream>

#include "absl/strings/string_view.h"
#include "kansuji/digit.h"

namespace kansuji {

// Places inside a four-digit group. The value is the power of ten.
enum class Place : int8_t {
  kUnits = 0,
  kTens = 1,      // 十
  kHundreds = 2,  // 百
  kThousands = 3,  // 千
};

inline constexpr int kNumPlaces = 4;

// Returns the marker of |place|: "千", "百", "十", or "" for units.
absl::string_view PlaceMarker(Place place);

// Returns the place marked by |c|, or nullopt if |c| is not 千, 百 or 十.
std::optional<Place> PlaceFromMarker(char32_t c);

// A group of four digits ("桁"), valued 0 to 9999. Six of them, each scaled by
// a power of 10^4, make the integer part of a Kansuji.
struct Keta {
  Digit thousands = Digit::kZero;
  Digit hundreds = Digit::kZero;
  Digit tens = Digit::kZero;
  Digit units = Digit::kZero;

  Digit at(Place place) const;
  void set(Place place, Digit digit);

  bool IsZero() const;
  bool IsOne() const;

  // Returns units + 10 * tens + 100 * hundreds + 1000 * thousands.
  uint16_t ToInt() const;

  // Splits |n| modulo 10000 into digits.
  static Keta FromInt(uint64_t n);

  friend bool operator==(const Keta& lhs, const Keta& rhs) = default;
};

// Writes the digits in place order, e.g. "Keta{二,零,五,一}".
std::ostream& operator<<(std::ostream& os, const Keta& keta);

}  // namespace kansuji

#endif  // KANSUJI_KANSUJI_KETA_H_

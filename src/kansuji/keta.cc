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

#include "kansuji/keta.h"

#include <cstdint>
#include <optional>
#include <ostream>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/string_view.h"
#include "kansuji/digit.h"

namespace kansuji {
namespace {

// Table of Kanji number ranks, indexed by Place.
constexpr absl::string_view kPlaceMarkers[kNumPlaces] = {"", "十", "百", "千"};

constexpr uint64_t kKetaModulus = 10000;

}  // namespace

absl::string_view PlaceMarker(const Place place) {
  return kPlaceMarkers[static_cast<int>(place)];
}

std::optional<Place> PlaceFromMarker(const char32_t c) {
  switch (c) {
    case U'千':
      return Place::kThousands;
    case U'百':
      return Place::kHundreds;
    case U'十':
      return Place::kTens;
    default:
      return std::nullopt;
  }
}

Digit Keta::at(const Place place) const {
  switch (place) {
    case Place::kThousands:
      return thousands;
    case Place::kHundreds:
      return hundreds;
    case Place::kTens:
      return tens;
    case Place::kUnits:
      return units;
  }
  LOG(FATAL) << "Unknown place: " << static_cast<int>(place);
}

void Keta::set(const Place place, const Digit digit) {
  switch (place) {
    case Place::kThousands:
      thousands = digit;
      return;
    case Place::kHundreds:
      hundreds = digit;
      return;
    case Place::kTens:
      tens = digit;
      return;
    case Place::kUnits:
      units = digit;
      return;
  }
  LOG(FATAL) << "Unknown place: " << static_cast<int>(place);
}

bool Keta::IsZero() const {
  return thousands == Digit::kZero && hundreds == Digit::kZero &&
         tens == Digit::kZero && units == Digit::kZero;
}

bool Keta::IsOne() const {
  return thousands == Digit::kZero && hundreds == Digit::kZero &&
         tens == Digit::kZero && units == Digit::kOne;
}

uint16_t Keta::ToInt() const {
  return DigitToValue(units) + DigitToValue(tens) * 10 +
         DigitToValue(hundreds) * 100 + DigitToValue(thousands) * 1000;
}

// static
Keta Keta::FromInt(uint64_t n) {
  n %= kKetaModulus;
  Keta keta;
  keta.thousands = DigitFromValue(static_cast<int>(n / 1000));
  keta.hundreds = DigitFromValue(static_cast<int>(n % 1000 / 100));
  keta.tens = DigitFromValue(static_cast<int>(n % 100 / 10));
  keta.units = DigitFromValue(static_cast<int>(n % 10));
  DCHECK_EQ(keta.ToInt(), n);
  return keta;
}

std::ostream& operator<<(std::ostream& os, const Keta& keta) {
  return os << "Keta{" << keta.thousands << "," << keta.hundreds << ","
            << keta.tens << "," << keta.units << "}";
}

}  // namespace kansuji

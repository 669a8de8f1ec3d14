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

#include "kansuji/kansuji_formatter.h"

#include <string>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "kansuji/digit.h"
#include "kansuji/kansuji.h"
#include "kansuji/keta.h"

namespace kansuji {
namespace {

constexpr absl::string_view kZero = "零";

constexpr Place kMarkedPlaces[] = {Place::kThousands, Place::kHundreds,
                                   Place::kTens};

}  // namespace

// static
void KansujiFormatter::AppendGroup(const Keta& keta, std::string* output) {
  DCHECK(output);
  for (const Place place : kMarkedPlaces) {
    const Digit digit = keta.at(place);
    if (digit == Digit::kZero) {
      continue;
    }
    absl::StrAppend(output, DigitToGlyph(digit), PlaceMarker(place));
  }
  if (keta.units != Digit::kZero) {
    absl::StrAppend(output, DigitToBareGlyph(keta.units));
  }
}

// static
std::string KansujiFormatter::FormatGroup(const Keta& keta) {
  std::string result;
  AppendGroup(keta, &result);
  return result;
}

// static
std::string KansujiFormatter::Format(const Kansuji& kansuji) {
  if (kansuji.IsZero()) {
    return std::string(kZero);
  }

  std::string result;
  for (const Magnitude magnitude : kMagnitudes) {
    const Keta& keta = kansuji.group(magnitude);
    if (keta.IsZero()) {
      continue;
    }
    // "万", not "一万". The base group keeps its "一".
    if (magnitude == Magnitude::kBase || !keta.IsOne()) {
      AppendGroup(keta, &result);
    }
    absl::StrAppend(&result, MagnitudeMarker(magnitude));
  }

  for (const FractionalPlace place : kFractionalPlaces) {
    const Digit digit = kansuji.fraction(place);
    if (digit == Digit::kZero) {
      continue;
    }
    absl::StrAppend(&result, DigitToBareGlyph(digit), FractionalMarker(place));
  }
  return result;
}

}  // namespace kansuji

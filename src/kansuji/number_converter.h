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

#ifndef KANSUJI_KANSUJI_NUMBER_CONVERTER_H_
#define KANSUJI_KANSUJI_NUMBER_CONVERTER_H_

#include <cstdint>

#include "absl/numeric/int128.h"
#include "absl/status/statusor.h"
#include "kansuji/kansuji.h"

namespace kansuji {

// Conversions between Kansuji and binary numbers.
//
// ToKansuji() splits the integer part into base-10000 groups. Kansuji holds
// 24 decimal digits; for larger absl::uint128 and floating point values only
// the lowest 24 digits are kept. Use ToKansujiChecked() to detect that.
//
// Floating point values are truncated toward zero, negative values and NaN
// become zero, and only three fractional digits (分, 厘, 毛) are kept; the
// rest of the fraction is truncated.
//
// The integer conversions from Kansuji wrap modulo 2^N like a narrowing cast
// when the value does not fit. Fractions are dropped.
class NumberConverter {
 public:
  NumberConverter() = delete;
  NumberConverter(const NumberConverter&) = delete;
  NumberConverter& operator=(const NumberConverter&) = delete;

  static Kansuji ToKansuji(uint8_t n);
  static Kansuji ToKansuji(uint16_t n);
  static Kansuji ToKansuji(uint32_t n);
  static Kansuji ToKansuji(uint64_t n);
  static Kansuji ToKansuji(absl::uint128 n);
  static Kansuji ToKansuji(float x);
  static Kansuji ToKansuji(double x);

  // Returns TooLarge if the integer part is 10^24 or larger.
  static absl::StatusOr<Kansuji> ToKansujiChecked(absl::uint128 n);
  static absl::StatusOr<Kansuji> ToKansujiChecked(double x);

  static uint8_t ToUInt8(const Kansuji& kansuji);
  static uint16_t ToUInt16(const Kansuji& kansuji);
  static uint32_t ToUInt32(const Kansuji& kansuji);
  static uint64_t ToUInt64(const Kansuji& kansuji);
  static absl::uint128 ToUInt128(const Kansuji& kansuji);
  static float ToFloat(const Kansuji& kansuji);
  static double ToDouble(const Kansuji& kansuji);

  // 10^24, one above the largest integer part.
  static absl::uint128 Limit();
};

}  // namespace kansuji

#endif  // KANSUJI_KANSUJI_NUMBER_CONVERTER_H_

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

#include "kansuji/number_converter.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "absl/numeric/int128.h"
#include "absl/status/statusor.h"
#include "base/vlog.h"
#include "kansuji/digit.h"
#include "kansuji/kansuji.h"
#include "kansuji/keta.h"
#include "kansuji/parse_error.h"

namespace kansuji {
namespace {

constexpr uint64_t kKetaBase = 10000;
constexpr uint64_t kTenToTwelve = 1000000000000;

// Stores |n| into the groups from the base group upward, i.e.
//   base = n % 10^4, 万 = n / 10^4 % 10^4, ...
// Groups above the magnitude of |n| stay zero. Digits above 垓 are dropped.
template <typename Integer>
Kansuji SplitIntoGroups(Integer n) {
  Kansuji result;
  for (int i = 0; i < kNumMagnitudes && n != 0; ++i) {
    result.set_group(static_cast<Magnitude>(i),
                     Keta::FromInt(static_cast<uint64_t>(n % kKetaBase)));
    n /= kKetaBase;
  }
  return result;
}

absl::uint128 IntegerPart(const Kansuji& kansuji) {
  absl::uint128 n = 0;
  for (const Magnitude magnitude : kMagnitudes) {
    const uint64_t keta = kansuji.group(magnitude).ToInt();
    n = n * kKetaBase + keta;
  }
  return n;
}

template <typename Float>
Float TwoToThe128() {
  // Infinity for float, whose largest finite value is below 2^128.
  return std::ldexp(static_cast<Float>(1), 128);
}

template <typename Float>
Kansuji FloatingPointToKansuji(const Float x) {
  // Negative values and NaN.
  if (!(x > 0)) {
    return Kansuji();
  }
  if (x >= TwoToThe128<Float>()) {
    KANSUJI_VLOG(1) << "Saturating " << x;
    return SplitIntoGroups(absl::Uint128Max());
  }

  const absl::uint128 n(x);
  Kansuji result = SplitIntoGroups(n);

  // Computed in the precision of |Float|, so 1.234 gives 234 thousandths but
  // 1.2345 still gives 234.
  const Float remainder =
      (x - static_cast<Float>(n)) * static_cast<Float>(1000);
  const int thousandths = std::clamp(static_cast<int>(remainder), 0, 999);
  result.set_fraction(FractionalPlace::kBu, DigitFromValue(thousandths / 100));
  result.set_fraction(FractionalPlace::kRin,
                      DigitFromValue(thousandths % 100 / 10));
  result.set_fraction(FractionalPlace::kMou, DigitFromValue(thousandths % 10));
  return result;
}

template <typename Float>
Float KansujiToFloatingPoint(const Kansuji& kansuji) {
  return static_cast<Float>(IntegerPart(kansuji)) +
         static_cast<Float>(kansuji.FractionInThousandths()) *
             static_cast<Float>(0.001);
}

}  // namespace

// static
absl::uint128 NumberConverter::Limit() {
  return absl::uint128(kTenToTwelve) * kTenToTwelve;
}

// static
Kansuji NumberConverter::ToKansuji(const uint8_t n) {
  return SplitIntoGroups(n);
}

// static
Kansuji NumberConverter::ToKansuji(const uint16_t n) {
  return SplitIntoGroups(n);
}

// static
Kansuji NumberConverter::ToKansuji(const uint32_t n) {
  return SplitIntoGroups(n);
}

// static
Kansuji NumberConverter::ToKansuji(const uint64_t n) {
  return SplitIntoGroups(n);
}

// static
Kansuji NumberConverter::ToKansuji(const absl::uint128 n) {
  return SplitIntoGroups(n);
}

// static
Kansuji NumberConverter::ToKansuji(const float x) {
  return FloatingPointToKansuji(x);
}

// static
Kansuji NumberConverter::ToKansuji(const double x) {
  return FloatingPointToKansuji(x);
}

// static
absl::StatusOr<Kansuji> NumberConverter::ToKansujiChecked(
    const absl::uint128 n) {
  if (n >= Limit()) {
    return TooLargeError("integer part is 10^24 or larger");
  }
  return ToKansuji(n);
}

// static
absl::StatusOr<Kansuji> NumberConverter::ToKansujiChecked(const double x) {
  if (x > 0 && (x >= TwoToThe128<double>() || absl::uint128(x) >= Limit())) {
    return TooLargeError("integer part is 10^24 or larger");
  }
  return ToKansuji(x);
}

// static
uint8_t NumberConverter::ToUInt8(const Kansuji& kansuji) {
  return static_cast<uint8_t>(ToUInt64(kansuji));
}

// static
uint16_t NumberConverter::ToUInt16(const Kansuji& kansuji) {
  return static_cast<uint16_t>(ToUInt64(kansuji));
}

// static
uint32_t NumberConverter::ToUInt32(const Kansuji& kansuji) {
  return static_cast<uint32_t>(ToUInt64(kansuji));
}

// static
uint64_t NumberConverter::ToUInt64(const Kansuji& kansuji) {
  return absl::Uint128Low64(IntegerPart(kansuji));
}

// static
absl::uint128 NumberConverter::ToUInt128(const Kansuji& kansuji) {
  return IntegerPart(kansuji);
}

// static
float NumberConverter::ToFloat(const Kansuji& kansuji) {
  return KansujiToFloatingPoint<float>(kansuji);
}

// static
double NumberConverter::ToDouble(const Kansuji& kansuji) {
  return KansujiToFloatingPoint<double>(kansuji);
}

}  // namespace kansuji

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

#ifndef KANSUJI_KANSUJI_DIGIT_H_
#define KANSUJI_KANSUJI_DIGIT_H_

#include <cstdint>
#include <optional>
#include <ostream>

#include "absl/strings/string_view.h"

namespace kansuji {

// A single decimal digit, 零 through 九. Ordered by its value.
enum class Digit : uint8_t {
  kZero = 0,  // 零
  kOne,       // 一
  kTwo,       // 二
  kThree,     // 三
  kFour,      // 四
  kFive,      // 五
  kSix,       // 六
  kSeven,     // 七
  kEight,     // 八
  kNine,      // 九
};

inline constexpr int kNumDigits = 10;

// Returns the digit of |value|.
// REQUIRES: 0 <= value <= 9.
Digit DigitFromValue(int value);

constexpr int DigitToValue(const Digit digit) {
  return static_cast<int>(digit);
}

// Returns the glyph written in front of a place or magnitude marker. 零 and 一
// have no glyph there: one thousand is "千", not "一千".
absl::string_view DigitToGlyph(Digit digit);

// Returns the glyph of a digit standing alone, e.g. the units digit or a
// fractional digit. Never empty.
absl::string_view DigitToBareGlyph(Digit digit);

// Returns the digit written as |c|, or nullopt if |c| is not one of 零一..九.
std::optional<Digit> DigitFromGlyph(char32_t c);

// Writes the bare glyph. Used by gtest to print values.
std::ostream& operator<<(std::ostream& os, Digit digit);

}  // namespace kansuji

#endif  // KANSUJI_KANSUJI_DIGIT_H_

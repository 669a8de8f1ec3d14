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

#include "kansuji/digit.h"

#include <optional>
#include <ostream>

#include "absl/log/check.h"
#include "absl/strings/string_view.h"

namespace kansuji {
namespace {

// Table of number character of Kansuji, indexed by value.
constexpr absl::string_view kBareGlyphs[kNumDigits] = {
    "零", "一", "二", "三", "四", "五", "六", "七", "八", "九"};

// Same as above, but 零 and 一 are elided.
constexpr absl::string_view kPrefixGlyphs[kNumDigits] = {
    "", "", "二", "三", "四", "五", "六", "七", "八", "九"};

constexpr char32_t kGlyphCodePoints[kNumDigits] = {
    U'零', U'一', U'二', U'三', U'四', U'五', U'六', U'七', U'八', U'九'};

}  // namespace

Digit DigitFromValue(const int value) {
  CHECK_GE(value, 0);
  CHECK_LT(value, kNumDigits);
  return static_cast<Digit>(value);
}

absl::string_view DigitToGlyph(const Digit digit) {
  return kPrefixGlyphs[DigitToValue(digit)];
}

absl::string_view DigitToBareGlyph(const Digit digit) {
  return kBareGlyphs[DigitToValue(digit)];
}

std::optional<Digit> DigitFromGlyph(const char32_t c) {
  for (int i = 0; i < kNumDigits; ++i) {
    if (kGlyphCodePoints[i] == c) {
      return static_cast<Digit>(i);
    }
  }
  return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const Digit digit) {
  return os << DigitToBareGlyph(digit);
}

}  // namespace kansuji

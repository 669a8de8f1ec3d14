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

#include "base/strings/utf8_cursor.h"

#include <cstddef>
#include <cstdint>
#include <string>

#include "absl/log/check.h"
#include "absl/strings/string_view.h"

namespace kansuji {
namespace strings {
namespace {

constexpr int kShift = 6;
constexpr uint8_t kTrailingMask = (1 << kShift) - 1;

// Returns the byte length of a UTF-8 sequence from its leading byte. Trailing
// and disallowed bytes (80-C1, F5-FF) have length 1 so that decoding resumes at
// the next byte.
constexpr uint8_t OneCharLen(const uint8_t leading_byte) {
  if (leading_byte < 0xc2) {
    return 1;
  } else if (leading_byte < 0xe0) {
    return 2;
  } else if (leading_byte < 0xf0) {
    return 3;
  } else if (leading_byte < 0xf5) {
    return 4;
  }
  return 1;
}

constexpr bool IsTrailingByte(const uint8_t c) { return (c & 0xc0) == 0x80; }

// From Unicode 15.0 §3.9 Table 3-7: Well-Formed UTF-8 Byte Sequences. The
// second byte has a narrower range for some leading bytes.
constexpr bool IsValidSecondByte(const uint8_t leading_byte,
                                 const uint8_t second_byte) {
  switch (leading_byte) {
    case 0xe0:
      return 0xa0 <= second_byte && second_byte <= 0xbf;
    case 0xed:
      return 0x80 <= second_byte && second_byte <= 0x9f;
    case 0xf0:
      return 0x90 <= second_byte && second_byte <= 0xbf;
    case 0xf4:
      return 0x80 <= second_byte && second_byte <= 0x8f;
    default:
      return IsTrailingByte(second_byte);
  }
}

struct DecodeResult {
  char32_t code_point;
  uint8_t bytes_seen;
};

DecodeResult DecodeOne(absl::string_view s) {
  DCHECK(!s.empty());
  const uint8_t leading_byte = static_cast<uint8_t>(s[0]);
  if (leading_byte < 0x80) {
    return {leading_byte, 1};
  }
  const uint8_t needed = OneCharLen(leading_byte);
  if (needed == 1) {
    return {kReplacementCharacter, 1};
  }
  if (s.size() < 2 ||
      !IsValidSecondByte(leading_byte, static_cast<uint8_t>(s[1]))) {
    return {kReplacementCharacter, 1};
  }
  constexpr uint8_t kLeadingMasks[] = {0, 0, 0x1f, 0x0f, 0x07};
  char32_t cp = leading_byte & kLeadingMasks[needed];
  cp = (cp << kShift) + (static_cast<uint8_t>(s[1]) & kTrailingMask);
  for (uint8_t i = 2; i < needed; ++i) {
    if (i >= s.size() || !IsTrailingByte(static_cast<uint8_t>(s[i]))) {
      return {kReplacementCharacter, i};
    }
    cp = (cp << kShift) + (static_cast<uint8_t>(s[i]) & kTrailingMask);
  }
  return {cp, needed};
}

}  // namespace

Utf8Cursor::Utf8Cursor(const absl::string_view text) : text_(text) {
  Decode();
}

char32_t Utf8Cursor::Get() const {
  DCHECK(!Done());
  return code_point_;
}

void Utf8Cursor::Next() {
  if (Done()) {
    return;
  }
  offset_ += char_length_;
  Decode();
}

void Utf8Cursor::Decode() {
  if (Done()) {
    code_point_ = 0;
    char_length_ = 0;
    return;
  }
  const DecodeResult result = DecodeOne(text_.substr(offset_));
  code_point_ = result.code_point;
  char_length_ = result.bytes_seen;
}

std::string Char32ToUtf8(char32_t cp) {
  // A naive UTF-8 encoder based on the WHATWG Encoding standard.
  // https://encoding.spec.whatwg.org/#utf-8-encoder
  if (cp > 0x10ffff) {
    cp = kReplacementCharacter;
  }
  std::string result;
  if (cp <= 0x7f) {
    result.push_back(static_cast<char>(cp));
    return result;
  }
  int count;
  uint8_t offset;
  if (cp <= 0x7ff) {
    count = 1;
    offset = 0xc0;
  } else if (cp <= 0xffff) {
    count = 2;
    offset = 0xe0;
  } else {
    count = 3;
    offset = 0xf0;
  }
  result.push_back(static_cast<char>((cp >> (kShift * count)) + offset));
  while (count > 0) {
    const uint8_t temp = static_cast<uint8_t>(cp >> (kShift * (count - 1)));
    result.push_back(static_cast<char>(0x80 | (temp & kTrailingMask)));
    --count;
  }
  return result;
}

}  // namespace strings
}  // namespace kansuji

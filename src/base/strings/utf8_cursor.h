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

#ifndef KANSUJI_BASE_STRINGS_UTF8_CURSOR_H_
#define KANSUJI_BASE_STRINGS_UTF8_CURSOR_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "absl/strings/string_view.h"

namespace kansuji {
namespace strings {

// The Unicode replacement character (U+FFFD) for ill-formed sequences.
inline constexpr char32_t kReplacementCharacter = 0xfffd;

// Forward-only reader over UTF-8 text with one character of lookahead.
//
//   Utf8Cursor cursor("二百五");
//   for (; !cursor.Done(); cursor.Next()) {
//     Process(cursor.Get());
//   }
//
// Ill-formed sequences are read as kReplacementCharacter; the cursor skips
// the bytes the decoder has seen, so it always makes progress.
class Utf8Cursor {
 public:
  explicit Utf8Cursor(absl::string_view text);

  Utf8Cursor(const Utf8Cursor&) = default;
  Utf8Cursor& operator=(const Utf8Cursor&) = default;

  // Returns the code point at the current position.
  // REQUIRES: !Done().
  char32_t Get() const;

  // Returns the UTF-8 bytes of the current character.
  absl::string_view GetUtf8() const {
    return text_.substr(offset_, char_length_);
  }

  // Advances to the next character. Does nothing at the end.
  void Next();

  bool Done() const { return offset_ >= text_.size(); }

  // Byte offset of the current character from the beginning of the text.
  size_t offset() const { return offset_; }

  // Unread part of the text, starting at the current character.
  absl::string_view rest() const { return text_.substr(offset_); }

 private:
  void Decode();

  absl::string_view text_;
  size_t offset_ = 0;
  char32_t code_point_ = 0;
  uint8_t char_length_ = 0;
};

// Converts a single code point to UTF-8. Code points outside of the Unicode
// range are converted to U+FFFD.
std::string Char32ToUtf8(char32_t cp);

}  // namespace strings
}  // namespace kansuji

#endif  // KANSUJI_BASE_STRINGS_UTF8_CURSOR_H_

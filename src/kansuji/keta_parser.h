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

#ifndef KANSUJI_KANSUJI_KETA_PARSER_H_
#define KANSUJI_KANSUJI_KETA_PARSER_H_

#include "absl/status/statusor.h"
#include "base/strings/utf8_cursor.h"
#include "kansuji/keta.h"

namespace kansuji {

struct KetaParseResult {
  Keta keta;
  // Characters consumed, digits and place markers together.
  int consumed_chars = 0;
  // Place markers (千, 百, 十) among them.
  int consumed_place_markers = 0;

  // True if the group was not written at all, e.g. the part before 万 in
  // "万一".
  bool empty() const { return consumed_chars == 0; }
};

// Reads one four-digit group such as "二千五十一".
//
// A digit glyph is held until a place marker commits it; a marker with no
// digit before it commits 一 ("千" is 1000), and of several digits in a row
// the last one wins. Place markers must appear in strictly descending order.
// The digit left when the group ends becomes the units digit.
//
// The group ends at the end of the input or in front of a magnitude marker
// (万 億 兆 京 垓) or a fractional marker (分 厘 毛). The terminating marker is
// not consumed.
class KetaParser {
 public:
  // What to do with a character that is neither a digit nor a marker.
  enum class UnknownCharPolicy {
    // Fail with UnexpectedChar.
    kReject,
    // End the group in front of it, like the end of the input.
    kStop,
  };

  KetaParser() = delete;
  KetaParser(const KetaParser&) = delete;
  KetaParser& operator=(const KetaParser&) = delete;

  // Parses a group starting at |cursor| and advances |cursor| past it.
  // Returns UnexpectedChar for a place marker out of order or repeated, and
  // for an unknown character under kReject. |cursor| points at the offending
  // character then.
  static absl::StatusOr<KetaParseResult> Parse(
      strings::Utf8Cursor* cursor,
      UnknownCharPolicy policy = UnknownCharPolicy::kReject);

  // Returns true if |c| ends a group: a magnitude or fractional marker.
  static bool IsGroupTerminator(char32_t c);
};

}  // namespace kansuji

#endif  // KANSUJI_KANSUJI_KETA_PARSER_H_

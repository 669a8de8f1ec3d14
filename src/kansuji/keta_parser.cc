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

#include "kansuji/keta_parser.h"

#include <optional>

#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "base/strings/utf8_cursor.h"
#include "base/vlog.h"
#include "kansuji/digit.h"
#include "kansuji/kansuji.h"
#include "kansuji/keta.h"
#include "kansuji/parse_error.h"

namespace kansuji {

// static
bool KetaParser::IsGroupTerminator(const char32_t c) {
  return MagnitudeFromMarker(c).has_value() ||
         FractionalPlaceFromMarker(c).has_value();
}

// static
absl::StatusOr<KetaParseResult> KetaParser::Parse(
    strings::Utf8Cursor* cursor, const UnknownCharPolicy policy) {
  DCHECK(cursor);
  KetaParseResult result;
  std::optional<Digit> pending;
  // Places at or above the ceiling are already taken.
  int ceiling = kNumPlaces;

  for (; !cursor->Done(); cursor->Next()) {
    const char32_t c = cursor->Get();
    if (const std::optional<Digit> digit = DigitFromGlyph(c);
        digit.has_value()) {
      pending = digit;
    } else if (const std::optional<Place> place = PlaceFromMarker(c);
               place.has_value()) {
      const int level = static_cast<int>(*place);
      if (level >= ceiling) {
        KANSUJI_VLOG(1) << "Place marker out of order: " << cursor->GetUtf8();
        return UnexpectedCharError(c, cursor->offset());
      }
      result.keta.set(*place, pending.value_or(Digit::kOne));
      pending.reset();
      ceiling = level;
      ++result.consumed_place_markers;
    } else if (IsGroupTerminator(c) || policy == UnknownCharPolicy::kStop) {
      break;
    } else {
      KANSUJI_VLOG(1) << "Not a numeral: " << cursor->GetUtf8();
      return UnexpectedCharError(c, cursor->offset());
    }
    ++result.consumed_chars;
  }

  result.keta.units = pending.value_or(Digit::kZero);
  return result;
}

}  // namespace kansuji

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

#include "kansuji/kansuji_parser.h"

#include <cstddef>
#include <optional>

#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "base/strings/utf8_cursor.h"
#include "base/vlog.h"
#include "kansuji/digit.h"
#include "kansuji/kansuji.h"
#include "kansuji/keta.h"
#include "kansuji/keta_parser.h"
#include "kansuji/parse_error.h"
#include "protocol/config.pb.h"

namespace kansuji {
namespace {

// One level above 垓. A marker is accepted only below the current level, and
// the level drops to the marker's own after it.
constexpr int kInitialLevel = static_cast<int>(Magnitude::kGai) + 1;
constexpr int kLastLevel = static_cast<int>(FractionalPlace::kMou);

enum class ParseMode {
  kWhole,
  kPrefix,
};

// A fractional marker takes one digit only, e.g. "三分" but not "十三分".
bool IsSingleDigit(const Keta& keta) {
  return keta.thousands == Digit::kZero && keta.hundreds == Digit::kZero &&
         keta.tens == Digit::kZero;
}

absl::StatusOr<Kansuji> ParseInternal(const absl::string_view input,
                                      const ParseMode mode, size_t* consumed) {
  DCHECK(consumed);
  const KetaParser::UnknownCharPolicy policy =
      mode == ParseMode::kPrefix ? KetaParser::UnknownCharPolicy::kStop
                                 : KetaParser::UnknownCharPolicy::kReject;
  strings::Utf8Cursor cursor(input);
  Kansuji result;
  int level = kInitialLevel;
  // End of the input already stored in |result|.
  size_t committed = 0;

  while (true) {
    const absl::StatusOr<KetaParseResult> group =
        KetaParser::Parse(&cursor, policy);
    if (!group.ok()) {
      return group.status();
    }

    // The last group has no marker and becomes the base group, also after a
    // fractional marker ("一分二" is 2.1).
    if (cursor.Done()) {
      result.set_group(Magnitude::kBase, group->keta);
      committed = cursor.offset();
      break;
    }

    // Stopped at a character outside the grammar. KetaParser only does that
    // in kPrefix mode. Digits after a fractional marker are left unread.
    if (!KetaParser::IsGroupTerminator(cursor.Get())) {
      DCHECK(mode == ParseMode::kPrefix);
      if (level > 0) {
        result.set_group(Magnitude::kBase, group->keta);
        committed = cursor.offset();
      }
      break;
    }

    const char32_t c = cursor.Get();
    if (const std::optional<Magnitude> magnitude = MagnitudeFromMarker(c);
        magnitude.has_value()) {
      const int marker_level = static_cast<int>(*magnitude);
      if (level <= marker_level) {
        KANSUJI_VLOG(1) << "Magnitude marker out of order: "
                        << cursor.GetUtf8() << " in " << input;
        return UnexpectedCharError(c, cursor.offset());
      }
      result.set_group(*magnitude,
                       group->empty() ? Keta::FromInt(1) : group->keta);
      level = marker_level;
    } else {
      const std::optional<FractionalPlace> place = FractionalPlaceFromMarker(c);
      DCHECK(place.has_value());
      const int marker_level = static_cast<int>(*place);
      if (level <= marker_level || !IsSingleDigit(group->keta)) {
        KANSUJI_VLOG(1) << "Invalid fractional marker: " << cursor.GetUtf8()
                        << " in " << input;
        return UnexpectedCharError(c, cursor.offset());
      }
      result.set_fraction(*place, group->keta.units);
      level = marker_level;
    }
    KANSUJI_VLOG(2) << "Accepted " << cursor.GetUtf8() << " at "
                    << cursor.offset();
    cursor.Next();
    committed = cursor.offset();

    // Nothing may follow 毛.
    if (level == kLastLevel) {
      break;
    }
  }

  *consumed = committed;
  if (mode == ParseMode::kWhole && !cursor.Done()) {
    KANSUJI_VLOG(1) << "Trailing input: " << cursor.rest();
    return UnexpectedCharError(cursor.Get(), cursor.offset());
  }
  return result;
}

}  // namespace

// static
absl::StatusOr<Kansuji> KansujiParser::Parse(const absl::string_view input) {
  size_t consumed = 0;
  return ParseInternal(input, ParseMode::kWhole, &consumed);
}

// static
absl::StatusOr<Kansuji> KansujiParser::ParsePrefix(
    const absl::string_view input, size_t* consumed) {
  DCHECK(consumed);
  *consumed = 0;
  return ParseInternal(input, ParseMode::kPrefix, consumed);
}

// static
absl::StatusOr<Kansuji> KansujiParser::ParseWithConfig(
    const absl::string_view input, const config::Config& config) {
  if (config.trailing_input() != config::Config::STOP_AT_UNKNOWN) {
    if (input.empty() && config.reject_empty_input()) {
      return UnexpectedEndError(0);
    }
    return Parse(input);
  }

  size_t consumed = 0;
  absl::StatusOr<Kansuji> result = ParsePrefix(input, &consumed);
  if (result.ok() && consumed == 0 && config.reject_empty_input()) {
    // Nothing was read. Report what stopped the parser.
    if (input.empty()) {
      return UnexpectedEndError(0);
    }
    const strings::Utf8Cursor cursor(input);
    return UnexpectedCharError(cursor.Get(), 0);
  }
  return result;
}

}  // namespace kansuji

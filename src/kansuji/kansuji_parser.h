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

#ifndef KANSUJI_KANSUJI_KANSUJI_PARSER_H_
#define KANSUJI_KANSUJI_KANSUJI_PARSER_H_

#include <cstddef>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "kansuji/kansuji.h"
#include "protocol/config.pb.h"

namespace kansuji {

// Parses Japanese numerals such as "二百五垓百万二十一" or "三分二厘".
//
// The input is a sequence of four-digit groups (see KetaParser), each
// followed by a magnitude marker (垓 京 兆 億 万) or a fractional marker
// (分 厘 毛); the group with no marker is the base group. Markers appear in
// strictly descending order and at most once. A fractional marker takes a
// single digit only, and nothing may follow 毛. A magnitude marker with nothing
// in front of it counts one, as in "万" (10^4) or "億万" (10^8 + 10^4). Digits
// at the end of the input are the base group even after a fractional marker.
//
// The empty string is zero.
//
// Errors are reported with the functions in kansuji/parse_error.h.
class KansujiParser {
 public:
  KansujiParser() = delete;
  KansujiParser(const KansujiParser&) = delete;
  KansujiParser& operator=(const KansujiParser&) = delete;

  // Parses the whole |input|. Any character that is not part of the numeral
  // is UnexpectedChar.
  static absl::StatusOr<Kansuji> Parse(absl::string_view input);

  // Parses the longest prefix of |input| that forms a numeral and stores its
  // length in bytes in |consumed|. Parsing stops at the first character that
  // is neither a digit nor a marker, and after 毛. Out-of-order markers are
  // still errors.
  static absl::StatusOr<Kansuji> ParsePrefix(absl::string_view input,
                                             size_t* consumed);

  // Same as Parse() or ParsePrefix(), as selected by `trailing_input` of
  // |config|, honoring `reject_empty_input`.
  static absl::StatusOr<Kansuji> ParseWithConfig(absl::string_view input,
                                                 const config::Config& config);
};

}  // namespace kansuji

#endif  // KANSUJI_KANSUJI_KANSUJI_PARSER_H_

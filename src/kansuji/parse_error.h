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

#ifndef KANSUJI_KANSUJI_PARSE_ERROR_H_
#define KANSUJI_KANSUJI_PARSE_ERROR_H_

#include <cstddef>
#include <optional>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "protocol/parse_error.pb.h"

namespace kansuji {

// Errors from the parser are absl::Status values carrying a ParseErrorDetail
// payload under this type URL:
//   UNEXPECTED_CHAR -> absl::StatusCode::kInvalidArgument
//   UNEXPECTED_END  -> absl::StatusCode::kOutOfRange
//   TOO_LARGE       -> absl::StatusCode::kOutOfRange
inline constexpr absl::string_view kParseErrorDetailUrl =
    "type.googleapis.com/kansuji.ParseErrorDetail";

// The character |c| at byte |offset| is invalid at its position.
absl::Status UnexpectedCharError(char32_t c, size_t offset);

// The input ended at byte |offset| in the middle of a numeral.
absl::Status UnexpectedEndError(size_t offset);

// The value exceeds the largest supported magnitude.
absl::Status TooLargeError(absl::string_view detail);

// Returns the detail attached by the functions above, or nullopt if |status|
// is OK or did not come from the parser.
std::optional<ParseErrorDetail> GetParseErrorDetail(const absl::Status& status);

// Shortcuts for GetParseErrorDetail().
std::optional<ParseErrorDetail::Kind> GetParseErrorKind(
    const absl::Status& status);
std::optional<char32_t> GetUnexpectedChar(const absl::Status& status);

}  // namespace kansuji

#endif  // KANSUJI_KANSUJI_PARSE_ERROR_H_

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

#include "kansuji/parse_error.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "base/strings/utf8_cursor.h"
#include "protocol/parse_error.pb.h"

namespace kansuji {
namespace {

absl::Status WithDetail(absl::Status status, const ParseErrorDetail& detail) {
  status.SetPayload(kParseErrorDetailUrl,
                    absl::Cord(detail.SerializeAsString()));
  return status;
}

}  // namespace

absl::Status UnexpectedCharError(const char32_t c, const size_t offset) {
  ParseErrorDetail detail;
  detail.set_kind(ParseErrorDetail::UNEXPECTED_CHAR);
  detail.set_code_point(c);
  detail.set_offset(offset);
  return WithDetail(
      absl::InvalidArgumentError(absl::StrFormat(
          "unexpected char: %s (U+%04X) at %d", strings::Char32ToUtf8(c),
          static_cast<uint32_t>(c), offset)),
      detail);
}

absl::Status UnexpectedEndError(const size_t offset) {
  ParseErrorDetail detail;
  detail.set_kind(ParseErrorDetail::UNEXPECTED_END);
  detail.set_offset(offset);
  return WithDetail(
      absl::OutOfRangeError(absl::StrFormat("unexpected end at %d", offset)),
      detail);
}

absl::Status TooLargeError(const absl::string_view detail_message) {
  ParseErrorDetail detail;
  detail.set_kind(ParseErrorDetail::TOO_LARGE);
  return WithDetail(
      absl::OutOfRangeError(absl::StrFormat("too large: %s", detail_message)),
      detail);
}

std::optional<ParseErrorDetail> GetParseErrorDetail(
    const absl::Status& status) {
  if (status.ok()) {
    return std::nullopt;
  }
  const absl::optional<absl::Cord> payload =
      status.GetPayload(kParseErrorDetailUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  ParseErrorDetail detail;
  if (!detail.ParseFromString(std::string(*payload))) {
    return std::nullopt;
  }
  return detail;
}

std::optional<ParseErrorDetail::Kind> GetParseErrorKind(
    const absl::Status& status) {
  const std::optional<ParseErrorDetail> detail = GetParseErrorDetail(status);
  if (!detail.has_value()) {
    return std::nullopt;
  }
  return detail->kind();
}

std::optional<char32_t> GetUnexpectedChar(const absl::Status& status) {
  const std::optional<ParseErrorDetail> detail = GetParseErrorDetail(status);
  if (!detail.has_value() ||
      detail->kind() != ParseErrorDetail::UNEXPECTED_CHAR) {
    return std::nullopt;
  }
  return static_cast<char32_t>(detail->code_point());
}

}  // namespace kansuji

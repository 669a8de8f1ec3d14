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

#ifndef KANSUJI_KANSUJI_KANSUJI_FORMATTER_H_
#define KANSUJI_KANSUJI_KANSUJI_FORMATTER_H_

#include <string>

#include "kansuji/kansuji.h"
#include "kansuji/keta.h"

namespace kansuji {

// Renders Kansuji in the canonical form, which KansujiParser reads back to the
// same integer value:
//   0                         -> "零"
//   1                         -> "一"
//   21                        -> "二十一"
//   1000                      -> "千"
//   10001                     -> "万一"
//   205 * 10^20 + 10^6 + 21   -> "二百五垓百万二十一"
//   1.234                     -> "一二分三厘四毛"
// 一 is elided in front of 千, 百, 十 and in front of a magnitude marker when
// the group is exactly one. Zero groups and zero fractional digits are
// omitted.
class KansujiFormatter {
 public:
  KansujiFormatter() = delete;
  KansujiFormatter(const KansujiFormatter&) = delete;
  KansujiFormatter& operator=(const KansujiFormatter&) = delete;

  static std::string Format(const Kansuji& kansuji);

  // Renders a single group without a magnitude marker, e.g. "二千五十一".
  // Returns an empty string for zero.
  static std::string FormatGroup(const Keta& keta);

  // Appends FormatGroup(keta) to |output|.
  static void AppendGroup(const Keta& keta, std::string* output);
};

}  // namespace kansuji

#endif  // KANSUJI_KANSUJI_KANSUJI_FORMATTER_H_

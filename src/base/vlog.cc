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

#include "base/vlog.h"

#include <algorithm>
#include <atomic>

#include "absl/flags/declare.h"
#include "absl/flags/flag.h"
#include "absl/log/flags.h"  // IWYU pragma: keep

// Abseil defines --v flag. We reuse it instead of defining our own.
ABSL_DECLARE_FLAG(int, v);

namespace kansuji {
namespace internal {
namespace {

constinit std::atomic<int> config_vlog_level = 0;

}  // namespace

int GetVLogLevel() {
  return std::max(absl::GetFlag(FLAGS_v), GetConfigVLogLevel());
}

void SetConfigVLogLevel(int v) {
  config_vlog_level.store(v, std::memory_order_release);
}

int GetConfigVLogLevel() {
  return config_vlog_level.load(std::memory_order_acquire);
}

}  // namespace internal

ScopedConfigVLogLevel::ScopedConfigVLogLevel(const int level)
    : saved_level_(internal::GetConfigVLogLevel()) {
  internal::SetConfigVLogLevel(level);
}

ScopedConfigVLogLevel::~ScopedConfigVLogLevel() {
  internal::SetConfigVLogLevel(saved_level_);
}

}  // namespace kansuji

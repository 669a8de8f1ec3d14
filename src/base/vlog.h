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

#ifndef KANSUJI_BASE_VLOG_H_
#define KANSUJI_BASE_VLOG_H_

#include "absl/log/log.h"

namespace kansuji {
namespace internal {

// Returns the effective verbose log level: the larger of the Abseil --v flag
// and the `verbose_level` pushed from the config.
int GetVLogLevel();

// Mirrors `Config::verbose_level`. The logging library does not depend on the
// config proto, so config::ConfigHandler calls this when it normalizes a
// config.
void SetConfigVLogLevel(int v);

// Returns the level last set by SetConfigVLogLevel().
int GetConfigVLogLevel();

}  // namespace internal

// Overrides the config verbose level for the lifetime of the object and
// restores the previous one on destruction. Intended for tests.
class ScopedConfigVLogLevel {
 public:
  explicit ScopedConfigVLogLevel(int level);
  ScopedConfigVLogLevel(const ScopedConfigVLogLevel&) = delete;
  ScopedConfigVLogLevel& operator=(const ScopedConfigVLogLevel&) = delete;
  ~ScopedConfigVLogLevel();

 private:
  const int saved_level_;
};

}  // namespace kansuji

#define KANSUJI_VLOG_IS_ON(severity) \
  (::kansuji::internal::GetVLogLevel() >= (severity))

#define KANSUJI_VLOG(severity) LOG_IF(INFO, KANSUJI_VLOG_IS_ON(severity))

#endif  // KANSUJI_BASE_VLOG_H_

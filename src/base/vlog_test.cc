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

#include "testing/gunit.h"

namespace kansuji {
namespace {

TEST(VLogTest, ConfigLevelRaisesVerbosity) {
  ScopedConfigVLogLevel scoped_level(3);
  EXPECT_EQ(internal::GetConfigVLogLevel(), 3);
  EXPECT_GE(internal::GetVLogLevel(), 3);
  EXPECT_TRUE(KANSUJI_VLOG_IS_ON(3));
}

TEST(VLogTest, ScopedLevelIsRestored) {
  const int original = internal::GetConfigVLogLevel();
  {
    ScopedConfigVLogLevel outer(1);
    {
      ScopedConfigVLogLevel inner(2);
      EXPECT_EQ(internal::GetConfigVLogLevel(), 2);
    }
    EXPECT_EQ(internal::GetConfigVLogLevel(), 1);
  }
  EXPECT_EQ(internal::GetConfigVLogLevel(), original);
}

}  // namespace
}  // namespace kansuji

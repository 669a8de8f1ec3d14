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

#include "config/config_handler.h"

#include "base/vlog.h"
#include "protocol/config.pb.h"
#include "testing/gunit.h"

namespace kansuji {
namespace config {
namespace {

TEST(ConfigHandlerTest, DefaultConfig) {
  const Config& config = ConfigHandler::DefaultConfig();
  EXPECT_FALSE(config.reject_empty_input());
  EXPECT_EQ(config.trailing_input(), Config::STRICT);
  EXPECT_EQ(config.verbose_level(), 0);

  Config copied;
  copied.set_reject_empty_input(true);
  ConfigHandler::GetDefaultConfig(&copied);
  EXPECT_FALSE(copied.reject_empty_input());
}

TEST(ConfigHandlerTest, NormalizeKeepsParserOptions) {
  Config config;
  config.set_reject_empty_input(true);
  config.set_trailing_input(Config::STOP_AT_UNKNOWN);
  const Config normalized = ConfigHandler::NormalizeConfig(config);
  EXPECT_TRUE(normalized.reject_empty_input());
  EXPECT_EQ(normalized.trailing_input(), Config::STOP_AT_UNKNOWN);
}

TEST(ConfigHandlerTest, NormalizeAppliesVerboseLevel) {
  ScopedConfigVLogLevel restore(0);
  Config config;
  config.set_verbose_level(2);
  const Config normalized = ConfigHandler::NormalizeConfig(config);
#ifdef NDEBUG
  EXPECT_FALSE(normalized.has_verbose_level());
  EXPECT_EQ(internal::GetConfigVLogLevel(), 0);
#else   // NDEBUG
  EXPECT_EQ(normalized.verbose_level(), 2);
  EXPECT_EQ(internal::GetConfigVLogLevel(), 2);
#endif  // NDEBUG
}

TEST(ConfigHandlerTest, NegativeVerboseLevelIsCleared) {
  ScopedConfigVLogLevel restore(0);
  Config config;
  config.set_verbose_level(-1);
  const Config normalized = ConfigHandler::NormalizeConfig(config);
  EXPECT_EQ(normalized.verbose_level(), 0);
  EXPECT_EQ(internal::GetConfigVLogLevel(), 0);
}

}  // namespace
}  // namespace config
}  // namespace kansuji

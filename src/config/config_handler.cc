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

// Handler of kansuji configuration.
#include "config/config_handler.h"

#include "base/vlog.h"
#include "protocol/config.pb.h"

namespace kansuji {
namespace config {
namespace {

Config CreateDefaultConfig() {
  Config config;
  config.set_reject_empty_input(false);
  config.set_trailing_input(Config::STRICT);
  return config;
}

}  // namespace

// static
void ConfigHandler::GetDefaultConfig(Config* config) {
  *config = DefaultConfig();
}

// static
const Config& ConfigHandler::DefaultConfig() {
  static const Config* const kDefaultConfig =
      new Config(CreateDefaultConfig());
  return *kDefaultConfig;
}

// static
Config ConfigHandler::NormalizeConfig(Config config) {
#ifdef NDEBUG
  // Delete the optional field from the config.
  config.clear_verbose_level();
#endif  // NDEBUG
  if (config.verbose_level() < 0) {
    config.clear_verbose_level();
  }
  internal::SetConfigVLogLevel(config.verbose_level());

  if (!Config::TrailingInput_IsValid(config.trailing_input())) {
    KANSUJI_VLOG(1) << "Unknown trailing_input: " << config.trailing_input();
    config.set_trailing_input(Config::STRICT);
  }
  return config;
}

}  // namespace config
}  // namespace kansuji

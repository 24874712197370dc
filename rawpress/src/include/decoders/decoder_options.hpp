//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.


#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

namespace rawpress {
/**
 * @brief Engine settings applied right before unpacking
 *
 * max_raw_memory_mb bounds the engine's peak raw buffer allocation so that malformed or
 * extreme-resolution files fail with LIBRAW_TOO_BIG instead of growing the host process.
 */
struct DecoderOptions {
  bool     use_rawspeed      = true;
  unsigned max_raw_memory_mb = 1024;

  bool    operator==(const DecoderOptions&) const = default;

  void     Validate() const;

  auto     ToJson() const -> nlohmann::json;
  void     FromJson(const nlohmann::json& options_json);

  static auto LoadFromFile(const std::filesystem::path& path) -> DecoderOptions;
};
};  // namespace rawpress

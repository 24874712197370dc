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


#include "decoders/decoder_options.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

namespace rawpress {
void DecoderOptions::Validate() const {
  if (max_raw_memory_mb == 0) {
    throw std::invalid_argument("DecoderOptions: max_raw_memory_mb must be positive");
  }
}

auto DecoderOptions::ToJson() const -> nlohmann::json {
  nlohmann::json options_json;
  options_json["use_rawspeed"]      = use_rawspeed;
  options_json["max_raw_memory_mb"] = max_raw_memory_mb;
  return options_json;
}

void DecoderOptions::FromJson(const nlohmann::json& options_json) {
  use_rawspeed      = options_json.value("use_rawspeed", use_rawspeed);
  max_raw_memory_mb = options_json.value("max_raw_memory_mb", max_raw_memory_mb);
  Validate();
}

auto DecoderOptions::LoadFromFile(const std::filesystem::path& path) -> DecoderOptions {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw std::runtime_error("DecoderOptions: unable to open " + path.string());
  }

  DecoderOptions options;
  try {
    nlohmann::json payload;
    ifs >> payload;
    options.FromJson(payload);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("DecoderOptions: malformed " + path.string() + ": " + e.what());
  }
  return options;
}
};  // namespace rawpress

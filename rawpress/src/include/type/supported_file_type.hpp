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

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <unordered_set>

namespace fs = std::filesystem;

namespace rawpress {
// Lower-case extensions of the camera raw containers the engine is expected to open
static const std::unordered_set<std::string> raw_extensions = {
    ".arw", ".cr2", ".cr3", ".crw", ".nef", ".nrw", ".dng", ".raw", ".raf",
    ".3fr", ".rw2", ".orf", ".pef", ".srw", ".x3f", ".iiq", ".erf", ".mos"};

inline bool is_raw_extension(const fs::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return raw_extensions.count(ext) > 0;
}

inline bool is_supported_file(const fs::path& path) {
  if (!fs::is_regular_file(path)) return false;
  return is_raw_extension(path);
}
};  // namespace rawpress

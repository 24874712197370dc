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

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace rawpress {

#define image_path_t    std::filesystem::path
#define file_path_t     std::filesystem::path

// One sample of the unpacked single-plane CFA buffer
#define raw_sample_t    uint16_t

// Index into the engine's embedded thumbnail list
#define thumb_index_t   int

// Engine status code, LIBRAW_SUCCESS on success
#define engine_status_t int

// Monotonic counter bumped on every mutating decoder call
#define generation_t    uint64_t
};  // namespace rawpress

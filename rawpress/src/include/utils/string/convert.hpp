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
#include <string>
#include <string_view>

namespace conv {
/**
 * @brief Copy a fixed-size, possibly unterminated char buffer into owned UTF-8 text.
 *
 * Reading stops at the first NUL or at capacity, whichever comes first. Byte sequences
 * that are not valid UTF-8 are replaced with U+FFFD, so this never fails.
 *
 * @param buffer   start of the engine-owned buffer, may be null
 * @param capacity documented size of the buffer in bytes
 */
auto FromFixedBuffer(const char* buffer, size_t capacity) -> std::string;

template <size_t N>
auto FromFixedBuffer(const char (&buffer)[N]) -> std::string {
  return FromFixedBuffer(buffer, N);
}

auto ToValidUtf8(std::string_view bytes) -> std::string;

auto TrimAscii(std::string_view value) -> std::string;
};  // namespace conv

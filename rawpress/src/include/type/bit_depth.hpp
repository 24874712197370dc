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

#include <cstdint>

#include "decoders/decode_error.hpp"

namespace rawpress {
// Output sample precision per color channel, no other value is accepted by the decoder
enum class BitDepth : int { BIT_DEPTH_8 = 8, BIT_DEPTH_16 = 16 };

constexpr auto IsSupportedBitDepth(BitDepth depth) -> bool {
  return depth == BitDepth::BIT_DEPTH_8 || depth == BitDepth::BIT_DEPTH_16;
}

constexpr auto BitsOf(BitDepth depth) -> int { return static_cast<int>(depth); }

inline void ValidateBitDepth(BitDepth depth) {
  if (!IsSupportedBitDepth(depth)) {
    throw InvalidBitDepthError(BitsOf(depth));
  }
}

/**
 * @brief Convert a user-supplied bit count, e.g. from a command line, into a BitDepth
 *
 * @param bits 8 or 16
 * @return BitDepth
 */
inline auto ToBitDepth(int bits) -> BitDepth {
  const auto depth = static_cast<BitDepth>(bits);
  ValidateBitDepth(depth);
  return depth;
}

template <BitDepth D>
struct BitDepthTraits;

template <>
struct BitDepthTraits<BitDepth::BIT_DEPTH_8> {
  using sample_t = uint8_t;
};

template <>
struct BitDepthTraits<BitDepth::BIT_DEPTH_16> {
  using sample_t = uint16_t;
};
};  // namespace rawpress

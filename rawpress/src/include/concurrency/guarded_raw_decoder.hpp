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

#include <mutex>
#include <type_traits>
#include <utility>

#include "decoders/raw_decoder.hpp"

namespace rawpress {
/**
 * @brief A RawDecoder behind a mutex, for handles that must be reachable from several threads.
 *
 * Every access goes through With(), which holds the lock for the whole callback. Nothing
 * borrowed from the decoder (a RawPixelView in particular) may escape the callback.
 */
class GuardedRawDecoder {
 public:
  explicit GuardedRawDecoder(RawDecoder&& decoder) : decoder_(std::move(decoder)) {}

  GuardedRawDecoder(const GuardedRawDecoder&)            = delete;
  GuardedRawDecoder& operator=(const GuardedRawDecoder&) = delete;

  template <typename Fn>
  auto With(Fn&& fn) -> std::invoke_result_t<Fn, RawDecoder&> {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::forward<Fn>(fn)(decoder_);
  }

  /**
   * @brief Take the decoder back out. Waits for any callback still running.
   */
  auto Release() && -> RawDecoder {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::move(decoder_);
  }

 private:
  std::mutex mtx_;
  RawDecoder decoder_;
};
};  // namespace rawpress

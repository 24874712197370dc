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

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <opencv2/core/mat.hpp>
#include <span>
#include <vector>

#include "type/type.hpp"

namespace rawpress {
/**
 * @brief Borrowed view of the unpacked CFA plane, raw_width x raw_height samples.
 *
 * The samples live inside the decoder and are only valid until the next mutating call on it
 * (Unpack, ExtractThumbnails, Process) or its destruction. The view remembers the decoder's
 * generation at creation and every access re-checks it, throwing StalePixelViewError instead
 * of reading freed memory. Copy() and ToMat() give owned data that survives later calls.
 */
class RawPixelView {
 public:
  using generation_ptr_t = std::shared_ptr<const std::atomic<generation_t>>;

  RawPixelView() = default;
  RawPixelView(const raw_sample_t* data, uint32_t raw_width, uint32_t raw_height,
               generation_ptr_t generation, generation_t expected);

  auto IsValid() const -> bool;
  auto Empty() const -> bool { return data_ == nullptr; }

  auto Width() const -> uint32_t { return width_; }
  auto Height() const -> uint32_t { return height_; }
  auto Size() const -> size_t { return static_cast<size_t>(width_) * height_; }

  auto Data() const -> std::span<const raw_sample_t>;
  auto At(uint32_t row, uint32_t col) const -> raw_sample_t;

  auto Copy() const -> std::vector<raw_sample_t>;
  // Owned CV_16UC1 copy
  auto ToMat() const -> cv::Mat;

 private:
  void                CheckFresh() const;

  const raw_sample_t* data_   = nullptr;
  uint32_t            width_  = 0;
  uint32_t            height_ = 0;
  generation_ptr_t    generation_;
  generation_t        expected_ = 0;
};
};  // namespace rawpress

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


#include "decoders/raw_pixel_view.hpp"

#include <opencv2/core.hpp>
#include <stdexcept>
#include <utility>

#include "decoders/decode_error.hpp"

namespace rawpress {
RawPixelView::RawPixelView(const raw_sample_t* data, uint32_t raw_width, uint32_t raw_height,
                           generation_ptr_t generation, generation_t expected)
    : data_(data),
      width_(data ? raw_width : 0),
      height_(data ? raw_height : 0),
      generation_(std::move(generation)),
      expected_(expected) {}

auto RawPixelView::IsValid() const -> bool {
  if (!data_) {
    return true;
  }
  return generation_ && generation_->load(std::memory_order_acquire) == expected_;
}

void RawPixelView::CheckFresh() const {
  if (!IsValid()) {
    throw StalePixelViewError();
  }
}

auto RawPixelView::Data() const -> std::span<const raw_sample_t> {
  CheckFresh();
  return {data_, Size()};
}

auto RawPixelView::At(uint32_t row, uint32_t col) const -> raw_sample_t {
  CheckFresh();
  if (row >= height_ || col >= width_) {
    throw std::out_of_range("RawPixelView: sample index out of range");
  }
  return data_[static_cast<size_t>(row) * width_ + col];
}

auto RawPixelView::Copy() const -> std::vector<raw_sample_t> {
  const auto samples = Data();
  return {samples.begin(), samples.end()};
}

auto RawPixelView::ToMat() const -> cv::Mat {
  CheckFresh();
  if (Empty()) {
    return {};
  }
  cv::Mat wrapped(static_cast<int>(height_), static_cast<int>(width_), CV_16UC1,
                  const_cast<raw_sample_t*>(data_));
  return wrapped.clone();
}
};  // namespace rawpress

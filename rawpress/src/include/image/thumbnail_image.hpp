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

#include <libraw/libraw.h>

#include <cstddef>
#include <cstdint>
#include <opencv2/core/mat.hpp>
#include <vector>

namespace rawpress {
enum class ThumbnailFormat : int { UNKNOWN, JPEG, BITMAP, BITMAP16, LAYER, ROLLEI, H265, JPEGXL };

auto ThumbnailFormatName(ThumbnailFormat format) -> const char*;

/**
 * @brief An embedded preview copied out of engine memory. Owns its bytes, so it stays valid
 * after the decoder that produced it is gone.
 */
struct ThumbnailImage {
  ThumbnailFormat      format = ThumbnailFormat::UNKNOWN;
  uint32_t             width  = 0;
  uint32_t             height = 0;
  int                  colors = 0;
  std::vector<uint8_t> data;

  static auto          FromLibRaw(const libraw_thumbnail_t& thumbnail) -> ThumbnailImage;

  /**
   * @brief Decode into a BGR cv::Mat. JPEG goes through cv::imdecode, 8 and 16 bit bitmaps are
   * wrapped and converted from RGB. Other formats throw std::runtime_error.
   */
  auto                 DecodeToMat() const -> cv::Mat;
};

/**
 * @brief Thumbnails of one raw file in engine index order. Nothing is filtered or
 * deduplicated, empty placeholders reported by the engine are kept as well.
 */
class ThumbnailCollection {
 public:
  using container_t    = std::vector<ThumbnailImage>;
  using const_iterator = container_t::const_iterator;

  ThumbnailCollection() = default;

  void Reserve(size_t count) { thumbnails_.reserve(count); }
  void Append(ThumbnailImage&& thumbnail) { thumbnails_.push_back(std::move(thumbnail)); }

  auto Size() const -> size_t { return thumbnails_.size(); }
  auto Empty() const -> bool { return thumbnails_.empty(); }

  auto operator[](size_t index) const -> const ThumbnailImage& { return thumbnails_[index]; }
  auto At(size_t index) const -> const ThumbnailImage& { return thumbnails_.at(index); }

  auto begin() const -> const_iterator { return thumbnails_.begin(); }
  auto end() const -> const_iterator { return thumbnails_.end(); }

  auto Release() && -> container_t { return std::move(thumbnails_); }

 private:
  container_t thumbnails_;
};
};  // namespace rawpress

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
#include <memory>
#include <opencv2/core/mat.hpp>
#include <span>
#include <utility>

#include "decoders/engine/decode_engine.hpp"
#include "type/bit_depth.hpp"

namespace rawpress {
enum class ImageFormat : int { UNKNOWN, JPEG, BITMAP };

auto ImageFormatName(ImageFormat format) -> const char*;

/**
 * @brief A developed image in a buffer allocated by the engine's materialize step.
 *
 * The buffer is handed back to the engine's release call exactly once, when the last owner
 * goes away. It does not reference the decoder that produced it.
 */
class ProcessedImageBuffer {
 public:
  /**
   * @brief Take ownership of image. engine must be the one that materialized it.
   */
  ProcessedImageBuffer(std::shared_ptr<DecodeEngine> engine, libraw_processed_image_t* image);

  ProcessedImageBuffer(ProcessedImageBuffer&&) noexcept            = default;
  ProcessedImageBuffer& operator=(ProcessedImageBuffer&&) noexcept = default;
  ProcessedImageBuffer(const ProcessedImageBuffer&)                = delete;
  ProcessedImageBuffer& operator=(const ProcessedImageBuffer&)     = delete;

  auto                  Empty() const -> bool { return image_ == nullptr; }
  auto                  Width() const -> uint32_t;
  auto                  Height() const -> uint32_t;
  auto                  Colors() const -> int;
  auto                  Bits() const -> int;
  auto                  GetFormat() const -> ImageFormat;
  auto                  DataSize() const -> size_t;
  auto                  Data() const -> std::span<const uint8_t>;

  /**
   * @brief Copy a bitmap result into an owned cv::Mat (CV_8UC(n) or CV_16UC(n)); three
   * channel images are reordered to BGR
   */
  auto                  ToMat() const -> cv::Mat;

 private:
  struct ImageReleaser {
    std::shared_ptr<DecodeEngine> engine_;
    void                          operator()(libraw_processed_image_t* image) const {
      if (image && engine_) engine_->ReleaseImage(image);
    }
  };

  auto                                                     Get() const -> const libraw_processed_image_t&;

  std::unique_ptr<libraw_processed_image_t, ImageReleaser> image_;
};

/**
 * @brief A processed image whose sample width is fixed at compile time
 */
template <BitDepth D>
class ProcessedImage : public ProcessedImageBuffer {
  static_assert(IsSupportedBitDepth(D), "ProcessedImage only supports 8 or 16 bit output");

 public:
  using sample_t                      = typename BitDepthTraits<D>::sample_t;
  static constexpr BitDepth kBitDepth = D;

  explicit ProcessedImage(ProcessedImageBuffer&& buffer)
      : ProcessedImageBuffer(std::move(buffer)) {}

  auto Samples() const -> std::span<const sample_t> {
    const auto bytes = Data();
    return {reinterpret_cast<const sample_t*>(bytes.data()), bytes.size() / sizeof(sample_t)};
  }
};
};  // namespace rawpress

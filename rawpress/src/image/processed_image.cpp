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


#include "image/processed_image.hpp"

#include <libraw/libraw_const.h>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace rawpress {
auto ImageFormatName(ImageFormat format) -> const char* {
  switch (format) {
    case ImageFormat::JPEG:
      return "jpeg";
    case ImageFormat::BITMAP:
      return "bitmap";
    case ImageFormat::UNKNOWN:
      return "unknown";
  }
  return "unknown";
}

ProcessedImageBuffer::ProcessedImageBuffer(std::shared_ptr<DecodeEngine> engine,
                                           libraw_processed_image_t*     image)
    : image_(image, ImageReleaser{std::move(engine)}) {}

auto ProcessedImageBuffer::Get() const -> const libraw_processed_image_t& {
  if (!image_) {
    throw std::runtime_error("Processed Image: No valid image data to be returned");
  }
  return *image_;
}

auto ProcessedImageBuffer::Width() const -> uint32_t { return Get().width; }

auto ProcessedImageBuffer::Height() const -> uint32_t { return Get().height; }

auto ProcessedImageBuffer::Colors() const -> int { return Get().colors; }

auto ProcessedImageBuffer::Bits() const -> int { return Get().bits; }

auto ProcessedImageBuffer::GetFormat() const -> ImageFormat {
  switch (Get().type) {
    case LIBRAW_IMAGE_JPEG:
      return ImageFormat::JPEG;
    case LIBRAW_IMAGE_BITMAP:
      return ImageFormat::BITMAP;
    default:
      return ImageFormat::UNKNOWN;
  }
}

auto ProcessedImageBuffer::DataSize() const -> size_t { return Get().data_size; }

auto ProcessedImageBuffer::Data() const -> std::span<const uint8_t> {
  const auto& image = Get();
  return {image.data, image.data_size};
}

auto ProcessedImageBuffer::ToMat() const -> cv::Mat {
  const auto& image = Get();
  if (GetFormat() != ImageFormat::BITMAP) {
    throw std::runtime_error("Processed Image: only bitmap output can be viewed as a cv::Mat");
  }
  if (image.colors != 1 && image.colors != 3) {
    throw std::runtime_error("Processed Image: unsupported channel count");
  }

  const int depth = image.bits == 16 ? CV_16U : CV_8U;
  cv::Mat   wrapped(image.height, image.width, CV_MAKETYPE(depth, image.colors),
                    const_cast<unsigned char*>(image.data));
  cv::Mat   img;
  if (image.colors == 3) {
    cv::cvtColor(wrapped, img, cv::COLOR_RGB2BGR);
  } else {
    img = wrapped.clone();
  }
  return img;
}
};  // namespace rawpress

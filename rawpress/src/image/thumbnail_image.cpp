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


#include "image/thumbnail_image.hpp"

#include <libraw/libraw_const.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>

namespace rawpress {
namespace {
auto FormatFromLibRaw(LibRaw_thumbnail_formats format) -> ThumbnailFormat {
  switch (format) {
    case LIBRAW_THUMBNAIL_JPEG:
      return ThumbnailFormat::JPEG;
    case LIBRAW_THUMBNAIL_BITMAP:
      return ThumbnailFormat::BITMAP;
    case LIBRAW_THUMBNAIL_BITMAP16:
      return ThumbnailFormat::BITMAP16;
    case LIBRAW_THUMBNAIL_LAYER:
      return ThumbnailFormat::LAYER;
    case LIBRAW_THUMBNAIL_ROLLEI:
      return ThumbnailFormat::ROLLEI;
    case LIBRAW_THUMBNAIL_H265:
      return ThumbnailFormat::H265;
    case LIBRAW_THUMBNAIL_JPEGXL:
      return ThumbnailFormat::JPEGXL;
    default:
      return ThumbnailFormat::UNKNOWN;
  }
}

auto WrapBitmap(const ThumbnailImage& thumb, int depth, size_t sample_size) -> cv::Mat {
  const size_t expected = static_cast<size_t>(thumb.width) * thumb.height *
                          static_cast<size_t>(thumb.colors) * sample_size;
  if (thumb.colors != 1 && thumb.colors != 3) {
    throw std::runtime_error("ThumbnailImage: unsupported bitmap channel count " +
                             std::to_string(thumb.colors));
  }
  if (thumb.data.size() < expected) {
    throw std::runtime_error("ThumbnailImage: bitmap buffer shorter than its geometry");
  }

  // The wrapper borrows data, cvtColor/clone below produce an owned Mat
  cv::Mat wrapped(static_cast<int>(thumb.height), static_cast<int>(thumb.width),
                  CV_MAKETYPE(depth, thumb.colors), const_cast<uint8_t*>(thumb.data.data()));
  cv::Mat img;
  if (thumb.colors == 3) {
    cv::cvtColor(wrapped, img, cv::COLOR_RGB2BGR);
  } else {
    img = wrapped.clone();
  }
  return img;
}
}  // namespace

auto ThumbnailFormatName(ThumbnailFormat format) -> const char* {
  switch (format) {
    case ThumbnailFormat::UNKNOWN:
      return "unknown";
    case ThumbnailFormat::JPEG:
      return "jpeg";
    case ThumbnailFormat::BITMAP:
      return "bitmap";
    case ThumbnailFormat::BITMAP16:
      return "bitmap16";
    case ThumbnailFormat::LAYER:
      return "layer";
    case ThumbnailFormat::ROLLEI:
      return "rollei";
    case ThumbnailFormat::H265:
      return "h265";
    case ThumbnailFormat::JPEGXL:
      return "jpegxl";
  }
  return "unknown";
}

auto ThumbnailImage::FromLibRaw(const libraw_thumbnail_t& thumbnail) -> ThumbnailImage {
  ThumbnailImage image;
  image.format = FormatFromLibRaw(thumbnail.tformat);
  image.width  = thumbnail.twidth;
  image.height = thumbnail.theight;
  image.colors = thumbnail.tcolors;
  if (thumbnail.thumb && thumbnail.tlength > 0) {
    const auto* begin = reinterpret_cast<const uint8_t*>(thumbnail.thumb);
    image.data.assign(begin, begin + thumbnail.tlength);
  }
  return image;
}

auto ThumbnailImage::DecodeToMat() const -> cv::Mat {
  switch (format) {
    case ThumbnailFormat::JPEG: {
      if (data.empty()) {
        throw std::runtime_error("ThumbnailImage: empty JPEG thumbnail");
      }
      cv::Mat img = cv::imdecode(data, cv::IMREAD_COLOR);
      if (img.empty()) {
        throw std::runtime_error("ThumbnailImage: unable to decode JPEG thumbnail");
      }
      return img;
    }
    case ThumbnailFormat::BITMAP:
      return WrapBitmap(*this, CV_8U, sizeof(uint8_t));
    case ThumbnailFormat::BITMAP16:
      return WrapBitmap(*this, CV_16U, sizeof(uint16_t));
    default:
      throw std::runtime_error(std::string("ThumbnailImage: unsupported thumbnail format ") +
                               ThumbnailFormatName(format));
  }
}
};  // namespace rawpress

#include "image/thumbnail_image.hpp"

#include <gtest/gtest.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>
#include <vector>

namespace rawpress {
namespace {
auto MakeBitmap(ThumbnailFormat format, uint32_t width, uint32_t height, size_t sample_size)
    -> ThumbnailImage {
  ThumbnailImage thumb;
  thumb.format = format;
  thumb.width  = width;
  thumb.height = height;
  thumb.colors = 3;
  thumb.data.assign(static_cast<size_t>(width) * height * 3 * sample_size, 0);
  return thumb;
}

TEST(ThumbnailImageTest, EightBitBitmapIsReorderedToBgr) {
  auto thumb    = MakeBitmap(ThumbnailFormat::BITMAP, 2, 2, sizeof(uint8_t));
  // First pixel is pure red in RGB order
  thumb.data[0] = 255;

  const cv::Mat img = thumb.DecodeToMat();
  ASSERT_EQ(img.type(), CV_8UC3);
  EXPECT_EQ(img.rows, 2);
  EXPECT_EQ(img.cols, 2);
  const auto px = img.at<cv::Vec3b>(0, 0);
  EXPECT_EQ(px[0], 0);
  EXPECT_EQ(px[2], 255);
}

TEST(ThumbnailImageTest, SixteenBitBitmap) {
  auto          thumb = MakeBitmap(ThumbnailFormat::BITMAP16, 3, 2, sizeof(uint16_t));
  const cv::Mat img   = thumb.DecodeToMat();
  EXPECT_EQ(img.type(), CV_16UC3);
  EXPECT_EQ(img.rows, 2);
  EXPECT_EQ(img.cols, 3);
}

TEST(ThumbnailImageTest, ShortBitmapBufferThrows) {
  auto thumb = MakeBitmap(ThumbnailFormat::BITMAP, 4, 4, sizeof(uint8_t));
  thumb.data.resize(10);
  EXPECT_THROW(thumb.DecodeToMat(), std::runtime_error);
}

TEST(ThumbnailImageTest, JpegIsDecoded) {
  cv::Mat              source(8, 12, CV_8UC3, cv::Scalar(10, 200, 30));
  std::vector<uint8_t> encoded;
  ASSERT_TRUE(cv::imencode(".jpg", source, encoded));

  ThumbnailImage thumb;
  thumb.format      = ThumbnailFormat::JPEG;
  thumb.data        = encoded;
  const cv::Mat img = thumb.DecodeToMat();
  EXPECT_EQ(img.rows, 8);
  EXPECT_EQ(img.cols, 12);
  EXPECT_EQ(img.channels(), 3);
}

TEST(ThumbnailImageTest, EmptyOrUnsupportedFormatsThrow) {
  ThumbnailImage empty_jpeg;
  empty_jpeg.format = ThumbnailFormat::JPEG;
  EXPECT_THROW(empty_jpeg.DecodeToMat(), std::runtime_error);

  for (auto format : {ThumbnailFormat::UNKNOWN, ThumbnailFormat::LAYER, ThumbnailFormat::H265,
                      ThumbnailFormat::JPEGXL}) {
    ThumbnailImage thumb;
    thumb.format = format;
    thumb.data.assign(32, 0x11);
    EXPECT_THROW(thumb.DecodeToMat(), std::runtime_error) << ThumbnailFormatName(format);
  }
}

TEST(ThumbnailImageTest, CopyFromEngineWithoutDataIsEmpty) {
  libraw_thumbnail_t raw{};
  raw.tformat = LIBRAW_THUMBNAIL_JPEG;
  raw.tlength = 128;
  raw.thumb   = nullptr;

  const auto thumb = ThumbnailImage::FromLibRaw(raw);
  EXPECT_EQ(thumb.format, ThumbnailFormat::JPEG);
  EXPECT_TRUE(thumb.data.empty());
}
}  // namespace
}  // namespace rawpress

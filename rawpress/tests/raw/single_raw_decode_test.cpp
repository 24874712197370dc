#include <gtest/gtest.h>

#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "decoders/raw_decoder.hpp"
#include "type/type.hpp"

namespace rawpress {
namespace {
struct SampleRaw {
  std::string file;
  uint32_t    width;
  uint32_t    height;
  uint32_t    iso_speed;
  float       shutter;
  float       aperture;
  float       focal_len;
  int         year, month, day, hour, minute, second;
  std::string artist;
  std::string make;
  std::string model;
  std::string software;
  float       max_aperture;
  std::string lens_make;
  std::string lens_name;
  std::string lens_serial;
  uint32_t    focal_35mm;
  std::string mount;
  std::string feature_prefix;
  size_t      processed_size;
};

auto SampleRaws() -> std::vector<SampleRaw> {
  return {
      {"test-z8.NEF", 8280, 5520, 250, 1.0f / 100.0f, 3.5f, 105.0f, 2024, 11, 4, 20, 11, 38,
       "HEXILEE", "Nikon", "Z 8", "Ver.02.00", 2.8f, "NIKON", "NIKKOR Z MC 105mm f/2.8 VR S",
       "20044280", 105, "Nikon Z", "AF", 274233600},
      {"test-a7rm4.ARW", 9568, 6376, 320, 1.0f / 500.0f, 4.0f, 40.0f, 2023, 11, 17, 13, 0, 13,
       "hexilee", "Sony", "ILCE-7RM4", "ILCE-7RM4 v1.20", 1.4f, "", "40mm F1.4 DG HSM | Art 018",
       "", 40, "Sony E", "", 366033408},
  };
}

auto SamplePath(const std::string& file) -> image_path_t {
  return image_path_t(TEST_IMG_PATH) / "raw" / file;
}

TEST(SingleRawDecode, MetadataMatchesCamera) {
  size_t checked = 0;
  for (const auto& sample : SampleRaws()) {
    const auto path = SamplePath(sample.file);
    if (!std::filesystem::exists(path)) {
      continue;
    }
    SCOPED_TRACE(sample.file);
    auto       decoder = RawDecoder::OpenFile(path);
    const auto info    = decoder.FullInfo();

    EXPECT_EQ(info.width, sample.width);
    EXPECT_EQ(info.height, sample.height);
    EXPECT_EQ(info.colors, 3);
    EXPECT_EQ(info.iso_speed, sample.iso_speed);
    EXPECT_FLOAT_EQ(info.shutter, sample.shutter);
    EXPECT_FLOAT_EQ(info.aperture, sample.aperture);
    EXPECT_FLOAT_EQ(info.focal_len, sample.focal_len);
    ASSERT_TRUE(info.datetime.has_value());
    EXPECT_EQ(info.datetime->year, sample.year);
    EXPECT_EQ(info.datetime->month, sample.month);
    EXPECT_EQ(info.datetime->day, sample.day);
    EXPECT_EQ(info.datetime->hour, sample.hour);
    EXPECT_EQ(info.datetime->minute, sample.minute);
    EXPECT_EQ(info.datetime->second, sample.second);
    EXPECT_EQ(info.gps, GpsInfo{});
    EXPECT_EQ(info.artist, sample.artist);
    EXPECT_EQ(info.desc, "");
    EXPECT_EQ(info.make, sample.make);
    EXPECT_EQ(info.model, sample.model);
    EXPECT_EQ(info.normalized_make, sample.make);
    EXPECT_EQ(info.normalized_model, sample.model);
    EXPECT_EQ(info.software, sample.software);
    EXPECT_EQ(info.raw_count, 1u);
    EXPECT_EQ(info.dng_version, 0u);

    const auto& lens = info.lens_info;
    EXPECT_FLOAT_EQ(lens.min_focal, sample.focal_len);
    EXPECT_FLOAT_EQ(lens.max_focal, sample.focal_len);
    EXPECT_FLOAT_EQ(lens.max_aperture_at_min_focal, sample.max_aperture);
    EXPECT_FLOAT_EQ(lens.max_aperture_at_max_focal, sample.max_aperture);
    EXPECT_EQ(lens.lens_make, sample.lens_make);
    EXPECT_EQ(lens.lens_name, sample.lens_name);
    EXPECT_EQ(lens.lens_serial, sample.lens_serial);
    EXPECT_EQ(lens.internal_lens_serial, "");
    EXPECT_EQ(lens.focal_length_in_35mm_format, sample.focal_35mm);
    EXPECT_EQ(lens.mount, sample.mount);
    EXPECT_EQ(lens.focus_type, FocusType::PRIME);
    EXPECT_EQ(lens.feature_prefix, sample.feature_prefix);
    EXPECT_EQ(lens.feature_suffix, "");

    EXPECT_EQ(decoder.FullInfo(), info);
    ++checked;
  }
  if (checked == 0) {
    GTEST_SKIP() << "No sample raws under " << TEST_IMG_PATH << "/raw";
  }
}

TEST(SingleRawDecode, UnpackAndProcessSixteenBit) {
  size_t checked = 0;
  for (const auto& sample : SampleRaws()) {
    const auto path = SamplePath(sample.file);
    if (!std::filesystem::exists(path)) {
      continue;
    }
    SCOPED_TRACE(sample.file);
    auto decoder = RawDecoder::OpenFile(path);
    decoder.Unpack();

    auto       view = decoder.RawPixels();
    const auto raw_pixels = static_cast<size_t>(decoder.RawWidth()) * decoder.RawHeight();
    EXPECT_EQ(view.Size(), raw_pixels);
    const auto copy = view.Copy();

    auto image = decoder.Process<BitDepth::BIT_DEPTH_16>();
    EXPECT_EQ(image.Width(), sample.width);
    EXPECT_EQ(image.Height(), sample.height);
    EXPECT_EQ(image.GetFormat(), ImageFormat::BITMAP);
    EXPECT_EQ(image.Colors(), 3);
    EXPECT_EQ(image.Bits(), 16);
    EXPECT_EQ(image.DataSize(), sample.processed_size);

    EXPECT_THROW(view.Data(), StalePixelViewError);
    EXPECT_EQ(copy.size(), raw_pixels);
    ++checked;
  }
  if (checked == 0) {
    GTEST_SKIP() << "No sample raws under " << TEST_IMG_PATH << "/raw";
  }
}

TEST(SingleRawDecode, ProcessEightBit) {
  size_t checked = 0;
  for (const auto& sample : SampleRaws()) {
    const auto path = SamplePath(sample.file);
    if (!std::filesystem::exists(path)) {
      continue;
    }
    SCOPED_TRACE(sample.file);
    auto decoder = RawDecoder::OpenFile(path);
    decoder.Unpack();
    auto image = decoder.Process<BitDepth::BIT_DEPTH_8>();
    EXPECT_EQ(image.Width(), sample.width);
    EXPECT_EQ(image.Height(), sample.height);
    EXPECT_EQ(image.Bits(), 8);
    EXPECT_EQ(image.DataSize(),
              static_cast<size_t>(image.Width()) * image.Height() * image.Colors());
    ++checked;
  }
  if (checked == 0) {
    GTEST_SKIP() << "No sample raws under " << TEST_IMG_PATH << "/raw";
  }
}

TEST(SingleRawDecode, GarbageIsNotARawFile) {
  const std::vector<uint8_t> garbage(4096, 0x5A);
  EXPECT_THROW(RawDecoder::Open(std::span<const uint8_t>(garbage)), OpenError);
}
}  // namespace
}  // namespace rawpress

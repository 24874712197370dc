#include "image/metadata.hpp"

#include <gtest/gtest.h>

#include <libraw/libraw_const.h>

#include <cmath>
#include <nlohmann/json.hpp>

#include "image/metadata_extractor.hpp"

namespace rawpress {
namespace {
auto SampleInfo() -> FullRawInfo {
  FullRawInfo info;
  info.width     = 8280;
  info.height    = 5520;
  info.colors    = 3;
  info.iso_speed = 250;
  info.shutter   = 0.01f;
  info.aperture  = 3.5f;
  info.focal_len = 105.0f;
  info.datetime  = CaptureTime::FromEpoch(1730751098);
  info.artist    = "HEXILEE";
  info.make      = "Nikon";
  info.model     = "Z 8";
  info.software  = "Ver.02.00";
  info.raw_count = 1;

  info.gps.latitude      = {31.0f, 14.0f, 30.5f};
  info.gps.longitude     = {121.0f, 28.0f, 12.0f};
  info.gps.altitude      = 12.5f;
  info.gps.latitude_ref  = 'N';
  info.gps.longitude_ref = 'E';
  info.gps.status        = 'A';
  info.gps.parsed        = true;

  auto& lens                       = info.lens_info;
  lens.min_focal                   = 105.0f;
  lens.max_focal                   = 105.0f;
  lens.max_aperture_at_min_focal   = 2.8f;
  lens.max_aperture_at_max_focal   = 2.8f;
  lens.lens_make                   = "NIKON";
  lens.lens_name                   = "NIKKOR Z MC 105mm f/2.8 VR S";
  lens.lens_serial                 = "20044280";
  lens.focal_length_in_35mm_format = 105;
  lens.mount                       = "Nikon Z";
  lens.focus_type                  = FocusType::PRIME;
  lens.feature_prefix              = "AF";
  return info;
}

TEST(FullRawInfoTest, JsonRoundTrip) {
  const auto     info = SampleInfo();
  nlohmann::json json = info.ToJson();
  EXPECT_EQ(json["pixels"].get<uint64_t>(), 8280ull * 5520ull);
  EXPECT_EQ(json["lens_info"]["focus_type"], "prime");
  EXPECT_EQ(json["gps"]["latitude_ref"], "N");
  ASSERT_TRUE(json["datetime"].is_string());

  FullRawInfo restored;
  restored.FromJson(json);
  EXPECT_EQ(restored, info);
}

TEST(FullRawInfoTest, MissingDateTimeSerializesAsNull) {
  FullRawInfo info;
  const auto  json = info.ToJson();
  EXPECT_TRUE(json["datetime"].is_null());

  FullRawInfo restored = SampleInfo();
  restored.FromJson(json);
  EXPECT_FALSE(restored.datetime.has_value());
  EXPECT_EQ(restored, info);
}

TEST(FullRawInfoTest, MissingKeysFallBackToDefaults) {
  FullRawInfo info;
  info.FromJson(nlohmann::json{{"make", "Sony"}, {"width", 9568}});
  EXPECT_EQ(info.make, "Sony");
  EXPECT_EQ(info.width, 9568u);
  EXPECT_EQ(info.height, 0u);
  EXPECT_EQ(info.lens_info, LensInfo{});
  EXPECT_EQ(info.gps, GpsInfo{});
}

TEST(CaptureTimeTest, NonPositiveEpochIsAbsent) {
  EXPECT_FALSE(CaptureTime::FromEpoch(0).has_value());
  EXPECT_FALSE(CaptureTime::FromEpoch(-5).has_value());
  EXPECT_FALSE(MetadataExtractor::CaptureTimeFromEpoch(0).has_value());
}

TEST(CaptureTimeTest, EpochBeyondFourDigitYearsIsAbsent) {
  EXPECT_FALSE(CaptureTime::FromEpoch(1000000000000).has_value());

  FullRawInfo info;
  info.datetime = CaptureTime::FromEpoch(1000000000000);
  FullRawInfo restored;
  restored.FromJson(info.ToJson());
  EXPECT_EQ(restored, info);
}

TEST(CaptureTimeTest, IsoTextKeepsTheInstant) {
  const auto time = CaptureTime::FromEpoch(1700226013);
  ASSERT_TRUE(time.has_value());
  const auto text = time->ToIso8601();
  EXPECT_EQ(text.size(), 25u);

  const auto parsed = CaptureTime::FromIso8601(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->epoch_seconds, 1700226013);
  EXPECT_EQ(parsed->hour, time->hour);
  EXPECT_EQ(parsed->minute, time->minute);
}

TEST(CaptureTimeTest, ParsesExplicitOffsets) {
  const auto utc = CaptureTime::FromIso8601("2024-11-04T20:11:38Z");
  ASSERT_TRUE(utc.has_value());
  EXPECT_EQ(utc->epoch_seconds, 1730751098);

  const auto shifted = CaptureTime::FromIso8601("2024-11-04T21:11:38+01:00");
  ASSERT_TRUE(shifted.has_value());
  EXPECT_EQ(shifted->epoch_seconds, 1730751098);

  EXPECT_FALSE(CaptureTime::FromIso8601("yesterday").has_value());
  EXPECT_FALSE(CaptureTime::FromIso8601("2024-13-04T20:11:38Z").has_value());
}

TEST(GpsInfoTest, DecimalCoordinatesFollowTheReference) {
  GpsInfo gps;
  EXPECT_FALSE(gps.DecimalLatitude().has_value());

  gps.latitude      = {33.0f, 51.0f, 54.0f};
  gps.longitude     = {151.0f, 12.0f, 36.0f};
  gps.latitude_ref  = 'S';
  gps.longitude_ref = 'E';
  gps.parsed        = true;
  ASSERT_TRUE(gps.DecimalLatitude().has_value());
  EXPECT_NEAR(*gps.DecimalLatitude(), -33.865, 1e-6);
  EXPECT_NEAR(*gps.DecimalLongitude(), 151.21, 1e-6);
}

TEST(GpsInfoTest, NonAsciiReferencesAreDroppedFromJson) {
  GpsInfo gps;
  gps.latitude_ref  = static_cast<char>(0xB0);
  gps.longitude_ref = 'W';
  gps.status        = static_cast<char>(0x80);
  gps.parsed        = true;

  nlohmann::json json;
  ASSERT_NO_THROW(json = gps.ToJson());
  EXPECT_NO_THROW(json.dump(2));
  EXPECT_EQ(json["latitude_ref"], "");
  EXPECT_EQ(json["longitude_ref"], "W");
  EXPECT_EQ(json["status"], "");
}

TEST(LensInfoTest, FocusTypeNamesRoundTrip) {
  for (auto type : {FocusType::UNDEFINED, FocusType::PRIME, FocusType::ZOOM,
                    FocusType::ZOOM_CONSTANT_APERTURE, FocusType::ZOOM_VARIABLE_APERTURE}) {
    EXPECT_EQ(FocusTypeFromName(FocusTypeName(type)), type);
  }
  EXPECT_EQ(FocusTypeFromName("tilt-shift"), FocusType::UNDEFINED);
}

TEST(MetadataExtractorTest, MountNames) {
  EXPECT_EQ(MetadataExtractor::MountName(LIBRAW_MOUNT_Nikon_Z), "Nikon Z");
  EXPECT_EQ(MetadataExtractor::MountName(LIBRAW_MOUNT_Sony_E), "Sony E");
  EXPECT_EQ(MetadataExtractor::MountName(-1), "Unknown");
  EXPECT_EQ(MetadataExtractor::FocusTypeFromLibRaw(LIBRAW_FT_ZOOM_LENS), FocusType::ZOOM);
}

TEST(MetadataExtractorTest, GpsIsCopiedFieldByField) {
  libraw_gps_info_t raw{};
  raw.latitude[0] = 48.0f;
  raw.latitude[1] = 51.0f;
  raw.latref      = 'N';
  raw.altref      = 1;
  raw.gpsstatus   = 'V';
  raw.gpsparsed   = 1;

  const auto gps  = MetadataExtractor::GpsFromLibRaw(raw);
  EXPECT_TRUE(gps.parsed);
  EXPECT_FLOAT_EQ(gps.latitude[1], 51.0f);
  EXPECT_EQ(gps.latitude_ref, 'N');
  EXPECT_EQ(gps.altitude_ref, 1);
  EXPECT_EQ(gps.status, 'V');
}
}  // namespace
}  // namespace rawpress

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

#include <array>
#include <cstdint>
#include <ctime>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace rawpress {
/**
 * @brief Capture instant of a raw file, resolved in the local time zone
 */
struct CaptureTime {
  std::time_t epoch_seconds      = 0;
  // Offset of the local zone from UTC at epoch_seconds
  long        utc_offset_seconds = 0;

  int         year               = 1970;
  int         month              = 1;
  int         day                = 1;
  int         hour               = 0;
  int         minute             = 0;
  int         second             = 0;

  /**
   * @brief Resolve an engine epoch. Zero, negative and unconvertible values have no
   * meaningful capture time and yield std::nullopt.
   */
  static auto FromEpoch(std::time_t epoch) -> std::optional<CaptureTime>;
  static auto FromIso8601(const std::string& text) -> std::optional<CaptureTime>;

  // e.g. 2024-11-04T20:11:38+08:00
  auto        ToIso8601() const -> std::string;

  auto        operator==(const CaptureTime& other) const -> bool {
    return epoch_seconds == other.epoch_seconds;
  }
};

struct GpsInfo {
  // degrees, minutes, seconds
  std::array<float, 3> latitude      = {0.0f, 0.0f, 0.0f};
  std::array<float, 3> longitude     = {0.0f, 0.0f, 0.0f};
  // hours, minutes, seconds (UTC)
  std::array<float, 3> gps_timestamp = {0.0f, 0.0f, 0.0f};
  float                altitude      = 0.0f;
  char                 altitude_ref  = 0;
  char                 latitude_ref  = 0;
  char                 longitude_ref = 0;
  char                 status        = 0;
  bool                 parsed        = false;

  bool                operator==(const GpsInfo&) const = default;

  auto                 DecimalLatitude() const -> std::optional<double>;
  auto                 DecimalLongitude() const -> std::optional<double>;

  auto                 ToJson() const -> nlohmann::json;
  void                 FromJson(const nlohmann::json& gps_json);
};

enum class FocusType : int {
  UNDEFINED,
  PRIME,
  ZOOM,
  ZOOM_CONSTANT_APERTURE,
  ZOOM_VARIABLE_APERTURE
};

auto FocusTypeName(FocusType type) -> const char*;
auto FocusTypeFromName(const std::string& name) -> FocusType;

struct LensInfo {
  float       min_focal                   = 0.0f;
  float       max_focal                   = 0.0f;
  float       max_aperture_at_min_focal   = 0.0f;
  float       max_aperture_at_max_focal   = 0.0f;
  std::string lens_make                   = "";
  std::string lens_name                   = "";
  std::string lens_serial                 = "";
  std::string internal_lens_serial        = "";
  uint32_t    focal_length_in_35mm_format = 0;
  std::string mount                       = "";
  FocusType   focus_type                  = FocusType::UNDEFINED;
  // Marketing tags printed around the lens name, e.g. "AF-S" / "VR"
  std::string feature_prefix              = "";
  std::string feature_suffix              = "";

  bool       operator==(const LensInfo&) const = default;

  auto        ToJson() const -> nlohmann::json;
  void        FromJson(const nlohmann::json& lens_json);
};

/**
 * @brief Snapshot of everything a decoder reports about an opened raw file
 */
struct FullRawInfo {
  uint32_t                   width            = 0;
  uint32_t                   height           = 0;
  int                        colors           = 0;
  uint32_t                   iso_speed        = 0;
  // seconds
  float                      shutter          = 0.0f;
  float                      aperture         = 0.0f;
  // mm
  float                      focal_len        = 0.0f;
  std::optional<CaptureTime> datetime         = std::nullopt;
  GpsInfo                    gps              = {};
  std::string                artist           = "";
  std::string                desc             = "";
  std::string                make             = "";
  std::string                model            = "";
  std::string                normalized_make  = "";
  std::string                normalized_model = "";
  std::string                software         = "";
  uint32_t                   raw_count        = 0;
  uint32_t                   dng_version      = 0;
  LensInfo                   lens_info        = {};

  bool                      operator==(const FullRawInfo&) const = default;

  auto Pixels() const -> uint64_t { return static_cast<uint64_t>(width) * height; }

  auto ToJson() const -> nlohmann::json;
  void FromJson(const nlohmann::json& info_json);
};
};  // namespace rawpress

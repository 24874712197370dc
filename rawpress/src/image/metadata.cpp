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


#include "image/metadata.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <format>

namespace rawpress {
namespace {
auto CivilToSeconds(int y, int m, int d, int hh, int mm, int ss) -> long long {
  using namespace std::chrono;
  const sys_days days = year{y} / month{static_cast<unsigned>(m)} / day{static_cast<unsigned>(d)};
  return static_cast<long long>(days.time_since_epoch().count()) * 86400LL + hh * 3600LL +
         mm * 60LL + ss;
}

auto ToLocal(std::time_t epoch, std::tm& out) -> bool {
#if defined(_WIN32)
  return localtime_s(&out, &epoch) == 0;
#else
  return localtime_r(&epoch, &out) != nullptr;
#endif
}

// Reference letters are single printable ASCII bytes (N, S, E, W, A, V); anything else
// would not be valid UTF-8 in the JSON output
auto IsPrintableAscii(char c) -> bool {
  const auto byte = static_cast<unsigned char>(c);
  return byte >= 0x20 && byte < 0x7F;
}

auto RefToString(char ref) -> std::string {
  if (!IsPrintableAscii(ref)) return {};
  return std::string(1, ref);
}

auto RefFromJson(const nlohmann::json& j, const char* key) -> char {
  const std::string value = j.value(key, std::string{});
  return value.empty() || !IsPrintableAscii(value.front()) ? 0 : value.front();
}

auto DmsToDecimal(const std::array<float, 3>& dms, bool negative) -> double {
  const double value = static_cast<double>(dms[0]) + static_cast<double>(dms[1]) / 60.0 +
                       static_cast<double>(dms[2]) / 3600.0;
  return negative ? -value : value;
}
}  // namespace

auto CaptureTime::FromEpoch(std::time_t epoch) -> std::optional<CaptureTime> {
  if (epoch <= 0) {
    return std::nullopt;
  }
  std::tm local{};
  if (!ToLocal(epoch, local)) {
    return std::nullopt;
  }
  // ISO-8601 text and the civil-day arithmetic below only cover four digit years
  if (local.tm_year + 1900 < 1 || local.tm_year + 1900 > 9999) {
    return std::nullopt;
  }

  CaptureTime time;
  time.epoch_seconds = epoch;
  time.year          = local.tm_year + 1900;
  time.month         = local.tm_mon + 1;
  time.day           = local.tm_mday;
  time.hour          = local.tm_hour;
  time.minute        = local.tm_min;
  time.second        = local.tm_sec;
  time.utc_offset_seconds =
      static_cast<long>(CivilToSeconds(time.year, time.month, time.day, time.hour, time.minute,
                                       time.second) -
                        static_cast<long long>(epoch));
  return time;
}

auto CaptureTime::FromIso8601(const std::string& text) -> std::optional<CaptureTime> {
  int y = 0, mo = 0, d = 0, hh = 0, mm = 0, ss = 0, consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &y, &mo, &d, &hh, &mm, &ss,
                  &consumed) != 6) {
    return std::nullopt;
  }
  if (mo < 1 || mo > 12 || d < 1 || d > 31 || hh > 23 || mm > 59 || ss > 60) {
    return std::nullopt;
  }

  long        offset = 0;
  const char* rest   = text.c_str() + consumed;
  if (*rest == '+' || *rest == '-') {
    int off_h = 0, off_m = 0;
    if (std::sscanf(rest + 1, "%2d:%2d", &off_h, &off_m) != 2) {
      return std::nullopt;
    }
    offset = (off_h * 3600L + off_m * 60L) * (*rest == '-' ? -1 : 1);
  } else if (*rest != 'Z' && *rest != '\0') {
    return std::nullopt;
  }

  const long long epoch = CivilToSeconds(y, mo, d, hh, mm, ss) - offset;
  return FromEpoch(static_cast<std::time_t>(epoch));
}

auto CaptureTime::ToIso8601() const -> std::string {
  const long abs_offset = std::labs(utc_offset_seconds);
  return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}{}{:02}:{:02}", year, month, day, hour,
                     minute, second, utc_offset_seconds < 0 ? '-' : '+', abs_offset / 3600,
                     (abs_offset % 3600) / 60);
}

auto GpsInfo::DecimalLatitude() const -> std::optional<double> {
  if (!parsed) return std::nullopt;
  return DmsToDecimal(latitude, latitude_ref == 'S' || latitude_ref == 's');
}

auto GpsInfo::DecimalLongitude() const -> std::optional<double> {
  if (!parsed) return std::nullopt;
  return DmsToDecimal(longitude, longitude_ref == 'W' || longitude_ref == 'w');
}

auto GpsInfo::ToJson() const -> nlohmann::json {
  nlohmann::json gps_json;
  gps_json["latitude"]      = latitude;
  gps_json["longitude"]     = longitude;
  gps_json["gps_timestamp"] = gps_timestamp;
  gps_json["altitude"]      = altitude;
  gps_json["altitude_ref"]  = static_cast<int>(altitude_ref);
  gps_json["latitude_ref"]  = RefToString(latitude_ref);
  gps_json["longitude_ref"] = RefToString(longitude_ref);
  gps_json["status"]        = RefToString(status);
  gps_json["parsed"]        = parsed;
  return gps_json;
}

void GpsInfo::FromJson(const nlohmann::json& gps_json) {
  const std::array<float, 3> zero = {0.0f, 0.0f, 0.0f};
  latitude      = gps_json.value("latitude", zero);
  longitude     = gps_json.value("longitude", zero);
  gps_timestamp = gps_json.value("gps_timestamp", zero);
  altitude      = gps_json.value("altitude", 0.0f);
  altitude_ref  = static_cast<char>(gps_json.value("altitude_ref", 0));
  latitude_ref  = RefFromJson(gps_json, "latitude_ref");
  longitude_ref = RefFromJson(gps_json, "longitude_ref");
  status        = RefFromJson(gps_json, "status");
  parsed        = gps_json.value("parsed", false);
}

auto FocusTypeName(FocusType type) -> const char* {
  switch (type) {
    case FocusType::UNDEFINED:
      return "undefined";
    case FocusType::PRIME:
      return "prime";
    case FocusType::ZOOM:
      return "zoom";
    case FocusType::ZOOM_CONSTANT_APERTURE:
      return "zoom_constant_aperture";
    case FocusType::ZOOM_VARIABLE_APERTURE:
      return "zoom_variable_aperture";
  }
  return "undefined";
}

auto FocusTypeFromName(const std::string& name) -> FocusType {
  if (name == "prime") return FocusType::PRIME;
  if (name == "zoom") return FocusType::ZOOM;
  if (name == "zoom_constant_aperture") return FocusType::ZOOM_CONSTANT_APERTURE;
  if (name == "zoom_variable_aperture") return FocusType::ZOOM_VARIABLE_APERTURE;
  return FocusType::UNDEFINED;
}

auto LensInfo::ToJson() const -> nlohmann::json {
  nlohmann::json lens_json;
  lens_json["min_focal"]                   = min_focal;
  lens_json["max_focal"]                   = max_focal;
  lens_json["max_aperture_at_min_focal"]   = max_aperture_at_min_focal;
  lens_json["max_aperture_at_max_focal"]   = max_aperture_at_max_focal;
  lens_json["lens_make"]                   = lens_make;
  lens_json["lens_name"]                   = lens_name;
  lens_json["lens_serial"]                 = lens_serial;
  lens_json["internal_lens_serial"]        = internal_lens_serial;
  lens_json["focal_length_in_35mm_format"] = focal_length_in_35mm_format;
  lens_json["mount"]                       = mount;
  lens_json["focus_type"]                  = FocusTypeName(focus_type);
  lens_json["feature_prefix"]              = feature_prefix;
  lens_json["feature_suffix"]              = feature_suffix;
  return lens_json;
}

void LensInfo::FromJson(const nlohmann::json& lens_json) {
  min_focal                   = lens_json.value("min_focal", 0.0f);
  max_focal                   = lens_json.value("max_focal", 0.0f);
  max_aperture_at_min_focal   = lens_json.value("max_aperture_at_min_focal", 0.0f);
  max_aperture_at_max_focal   = lens_json.value("max_aperture_at_max_focal", 0.0f);
  lens_make                   = lens_json.value("lens_make", "");
  lens_name                   = lens_json.value("lens_name", "");
  lens_serial                 = lens_json.value("lens_serial", "");
  internal_lens_serial        = lens_json.value("internal_lens_serial", "");
  focal_length_in_35mm_format = lens_json.value("focal_length_in_35mm_format", 0u);
  mount                       = lens_json.value("mount", "");
  focus_type                  = FocusTypeFromName(lens_json.value("focus_type", "undefined"));
  feature_prefix              = lens_json.value("feature_prefix", "");
  feature_suffix              = lens_json.value("feature_suffix", "");
}

auto FullRawInfo::ToJson() const -> nlohmann::json {
  nlohmann::json info_json;
  // Geometry
  info_json["width"]            = width;
  info_json["height"]           = height;
  info_json["pixels"]           = Pixels();
  info_json["colors"]           = colors;

  // Exposure
  info_json["iso_speed"]        = iso_speed;
  info_json["shutter"]          = shutter;
  info_json["aperture"]         = aperture;
  info_json["focal_len"]        = focal_len;
  info_json["datetime"] = datetime ? nlohmann::json(datetime->ToIso8601()) : nlohmann::json(nullptr);
  info_json["gps"]              = gps.ToJson();

  // Text
  info_json["artist"]           = artist;
  info_json["desc"]             = desc;
  info_json["make"]             = make;
  info_json["model"]            = model;
  info_json["normalized_make"]  = normalized_make;
  info_json["normalized_model"] = normalized_model;
  info_json["software"]         = software;

  info_json["raw_count"]        = raw_count;
  info_json["dng_version"]      = dng_version;
  info_json["lens_info"]        = lens_info.ToJson();
  return info_json;
}

void FullRawInfo::FromJson(const nlohmann::json& info_json) {
  width     = info_json.value("width", 0u);
  height    = info_json.value("height", 0u);
  colors    = info_json.value("colors", 0);

  iso_speed = info_json.value("iso_speed", 0u);
  shutter   = info_json.value("shutter", 0.0f);
  aperture  = info_json.value("aperture", 0.0f);
  focal_len = info_json.value("focal_len", 0.0f);

  datetime  = std::nullopt;
  if (info_json.contains("datetime") && info_json["datetime"].is_string()) {
    datetime = CaptureTime::FromIso8601(info_json["datetime"].get<std::string>());
  }

  gps = GpsInfo{};
  if (info_json.contains("gps") && info_json["gps"].is_object()) {
    gps.FromJson(info_json["gps"]);
  }

  artist           = info_json.value("artist", "");
  desc             = info_json.value("desc", "");
  make             = info_json.value("make", "");
  model            = info_json.value("model", "");
  normalized_make  = info_json.value("normalized_make", "");
  normalized_model = info_json.value("normalized_model", "");
  software         = info_json.value("software", "");

  raw_count        = info_json.value("raw_count", 0u);
  dng_version      = info_json.value("dng_version", 0u);

  lens_info = LensInfo{};
  if (info_json.contains("lens_info") && info_json["lens_info"].is_object()) {
    lens_info.FromJson(info_json["lens_info"]);
  }
}
};  // namespace rawpress

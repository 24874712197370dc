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

#include <ctime>
#include <optional>
#include <string>

#include "image/metadata.hpp"

namespace rawpress {
/**
 * @brief Pure transforms from engine-owned metadata structs to owned value types. Nothing
 * here touches engine memory beyond the struct passed in, and nothing here fails.
 */
class MetadataExtractor {
 public:
  static auto GpsFromLibRaw(const libraw_gps_info_t& gps) -> GpsInfo;

  /**
   * @brief Build a lens descriptor from the EXIF lens block, falling back to the maker note
   * block for fields the EXIF block leaves empty
   *
   * @param lens
   * @return LensInfo
   */
  static auto LensFromLibRaw(const libraw_lensinfo_t& lens) -> LensInfo;

  static auto CaptureTimeFromEpoch(std::time_t timestamp) -> std::optional<CaptureTime>;

  static auto FocusTypeFromLibRaw(int focal_type) -> FocusType;

  /**
   * @brief Human-readable name of a LibRaw_camera_mounts code, e.g. "Nikon Z". Unknown
   * codes map to "Unknown".
   */
  static auto MountName(int mount) -> std::string;
};
}  // namespace rawpress

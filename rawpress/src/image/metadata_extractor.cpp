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


#include "image/metadata_extractor.hpp"

#include <libraw/libraw_const.h>

#include "utils/string/convert.hpp"

namespace rawpress {
namespace {
// Corrupt files can put any byte into the one-letter GPS references
auto AsciiRef(char ref) -> char {
  const auto byte = static_cast<unsigned char>(ref);
  return byte >= 0x20 && byte < 0x7F ? ref : 0;
}

auto TextOrFallback(std::string primary, std::string fallback) -> std::string {
  return primary.empty() ? fallback : primary;
}
}  // namespace

auto MetadataExtractor::GpsFromLibRaw(const libraw_gps_info_t& gps) -> GpsInfo {
  GpsInfo info;
  for (int i = 0; i < 3; ++i) {
    info.latitude[i]      = gps.latitude[i];
    info.longitude[i]     = gps.longitude[i];
    info.gps_timestamp[i] = gps.gpstimestamp[i];
  }
  info.altitude      = gps.altitude;
  info.altitude_ref  = gps.altref;
  info.latitude_ref  = AsciiRef(gps.latref);
  info.longitude_ref = AsciiRef(gps.longref);
  info.status        = AsciiRef(gps.gpsstatus);
  info.parsed        = gps.gpsparsed != 0;
  return info;
}

auto MetadataExtractor::LensFromLibRaw(const libraw_lensinfo_t& lens) -> LensInfo {
  const auto& notes = lens.makernotes;

  LensInfo    info;
  info.min_focal                 = lens.MinFocal;
  info.max_focal                 = lens.MaxFocal;
  info.max_aperture_at_min_focal = lens.MaxAp4MinFocal;
  info.max_aperture_at_max_focal = lens.MaxAp4MaxFocal;

  info.lens_make            = conv::FromFixedBuffer(lens.LensMake);
  info.lens_name = TextOrFallback(conv::FromFixedBuffer(lens.Lens), conv::FromFixedBuffer(notes.Lens));
  info.lens_serial          = conv::FromFixedBuffer(lens.LensSerial);
  info.internal_lens_serial = conv::FromFixedBuffer(lens.InternalLensSerial);

  info.focal_length_in_35mm_format = lens.FocalLengthIn35mmFormat;
  if (info.focal_length_in_35mm_format == 0) {
    info.focal_length_in_35mm_format = notes.FocalLengthIn35mmFormat;
  }

  info.mount          = MountName(notes.LensMount);
  info.focus_type     = FocusTypeFromLibRaw(notes.FocalType);
  info.feature_prefix = conv::FromFixedBuffer(notes.LensFeatures_pre);
  info.feature_suffix = conv::FromFixedBuffer(notes.LensFeatures_suf);
  return info;
}

auto MetadataExtractor::CaptureTimeFromEpoch(std::time_t timestamp) -> std::optional<CaptureTime> {
  return CaptureTime::FromEpoch(timestamp);
}

auto MetadataExtractor::FocusTypeFromLibRaw(int focal_type) -> FocusType {
  switch (focal_type) {
    case LIBRAW_FT_PRIME_LENS:
      return FocusType::PRIME;
    case LIBRAW_FT_ZOOM_LENS:
      return FocusType::ZOOM;
    case LIBRAW_FT_ZOOM_LENS_CONSTANT_APERTURE:
      return FocusType::ZOOM_CONSTANT_APERTURE;
    case LIBRAW_FT_ZOOM_LENS_VARIABLE_APERTURE:
      return FocusType::ZOOM_VARIABLE_APERTURE;
    case LIBRAW_FT_UNDEFINED:
    default:
      return FocusType::UNDEFINED;
  }
}

auto MetadataExtractor::MountName(int mount) -> std::string {
  switch (mount) {
    case LIBRAW_MOUNT_Alpa:
      return "Alpa";
    case LIBRAW_MOUNT_C:
      return "C";
    case LIBRAW_MOUNT_Canon_EF_M:
      return "Canon EF-M";
    case LIBRAW_MOUNT_Canon_EF_S:
      return "Canon EF-S";
    case LIBRAW_MOUNT_Canon_EF:
      return "Canon EF";
    case LIBRAW_MOUNT_Canon_RF:
      return "Canon RF";
    case LIBRAW_MOUNT_Contax_N:
      return "Contax N";
    case LIBRAW_MOUNT_Contax645:
      return "Contax 645";
    case LIBRAW_MOUNT_FT:
      return "Four Thirds";
    case LIBRAW_MOUNT_mFT:
      return "Micro Four Thirds";
    case LIBRAW_MOUNT_Fuji_GF:
      return "Fujifilm G";
    case LIBRAW_MOUNT_Fuji_GX:
      return "Fujifilm GX";
    case LIBRAW_MOUNT_Fuji_X:
      return "Fujifilm X";
    case LIBRAW_MOUNT_Hasselblad_H:
      return "Hasselblad H";
    case LIBRAW_MOUNT_Hasselblad_V:
      return "Hasselblad V";
    case LIBRAW_MOUNT_Hasselblad_XCD:
      return "Hasselblad XCD";
    case LIBRAW_MOUNT_Leica_M:
      return "Leica M";
    case LIBRAW_MOUNT_Leica_R:
      return "Leica R";
    case LIBRAW_MOUNT_Leica_S:
      return "Leica S";
    case LIBRAW_MOUNT_Leica_SL:
      return "Leica SL";
    case LIBRAW_MOUNT_Leica_TL:
      return "Leica TL";
    case LIBRAW_MOUNT_LPS_L:
      return "L-Mount";
    case LIBRAW_MOUNT_Mamiya67:
      return "Mamiya 67";
    case LIBRAW_MOUNT_Mamiya645:
      return "Mamiya 645";
    case LIBRAW_MOUNT_Minolta_A:
      return "Minolta A";
    case LIBRAW_MOUNT_Nikon_CX:
      return "Nikon CX";
    case LIBRAW_MOUNT_Nikon_F:
      return "Nikon F";
    case LIBRAW_MOUNT_Nikon_Z:
      return "Nikon Z";
    case LIBRAW_MOUNT_PhaseOne_iXM_MV:
      return "Phase One iXM MV";
    case LIBRAW_MOUNT_PhaseOne_iXM_RS:
      return "Phase One iXM RS";
    case LIBRAW_MOUNT_PhaseOne_iXM:
      return "Phase One iXM";
    case LIBRAW_MOUNT_Pentax_645:
      return "Pentax 645";
    case LIBRAW_MOUNT_Pentax_K:
      return "Pentax K";
    case LIBRAW_MOUNT_Pentax_Q:
      return "Pentax Q";
    case LIBRAW_MOUNT_RicohModule:
      return "Ricoh Module";
    case LIBRAW_MOUNT_Rollei_bayonet:
      return "Rollei Bayonet";
    case LIBRAW_MOUNT_Samsung_NX_M:
      return "Samsung NX-M";
    case LIBRAW_MOUNT_Samsung_NX:
      return "Samsung NX";
    case LIBRAW_MOUNT_Sigma_X3F:
      return "Sigma X3F";
    case LIBRAW_MOUNT_Sony_E:
      return "Sony E";
    case LIBRAW_MOUNT_LF:
      return "Large Format";
    case LIBRAW_MOUNT_DigitalBack:
      return "Digital Back";
    case LIBRAW_MOUNT_FixedLens:
      return "Fixed Lens";
    case LIBRAW_MOUNT_IL_UM:
      return "Interchangeable Lens";
    case LIBRAW_MOUNT_Unknown:
    default:
      return "Unknown";
  }
}
}  // namespace rawpress

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

#include <memory>

#include "decoders/engine/decode_engine.hpp"

namespace rawpress {
class LibRawEngine : public DecodeEngine {
 public:
  LibRawEngine() = default;

  static auto Shared() -> std::shared_ptr<DecodeEngine>;

  auto Open(const void* buffer, size_t size, engine_status_t& status) -> LibRaw* override;
  void Configure(LibRaw& processor, const DecoderOptions& options) override;
  auto Unpack(LibRaw& processor) -> engine_status_t override;
  auto UnpackThumbnail(LibRaw& processor, thumb_index_t index) -> engine_status_t override;
  auto RunPipeline(LibRaw& processor, BitDepth depth) -> engine_status_t override;
  auto MaterializeImage(LibRaw& processor, engine_status_t& status)
      -> libraw_processed_image_t* override;
  void ReleaseImage(libraw_processed_image_t* image) override;
  void Close(LibRaw* processor) override;
};
};  // namespace rawpress

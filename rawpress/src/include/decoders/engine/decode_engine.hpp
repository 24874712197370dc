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

#include <cstddef>

#include "decoders/decoder_options.hpp"
#include "type/bit_depth.hpp"
#include "type/type.hpp"

namespace rawpress {
/**
 * @brief The fixed operation set through which the decoder talks to the native engine.
 *
 * Every call returning a status hands it back unchecked; RawDecoder is responsible for
 * checking it before touching any engine memory. Implementations carry no per-handle state
 * of their own, all of it lives in the LibRaw instance they hand out.
 */
class DecodeEngine {
 public:
  virtual ~DecodeEngine() = default;

  /**
   * @brief Create an engine instance and parse the container held in buffer.
   *
   * @return the opened instance, or nullptr with status set. A failed open leaves nothing
   * for the caller to close.
   */
  virtual auto Open(const void* buffer, size_t size, engine_status_t& status) -> LibRaw* = 0;

  virtual void Configure(LibRaw& processor, const DecoderOptions& options) = 0;

  virtual auto Unpack(LibRaw& processor) -> engine_status_t = 0;

  virtual auto UnpackThumbnail(LibRaw& processor, thumb_index_t index) -> engine_status_t = 0;

  virtual auto RunPipeline(LibRaw& processor, BitDepth depth) -> engine_status_t = 0;

  /**
   * @brief Package the developed image into a standalone buffer owned by the caller, to be
   * handed back through ReleaseImage
   */
  virtual auto MaterializeImage(LibRaw& processor, engine_status_t& status)
      -> libraw_processed_image_t* = 0;

  virtual void ReleaseImage(libraw_processed_image_t* image) = 0;

  virtual void Close(LibRaw* processor) = 0;
};
};  // namespace rawpress

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


#include "decoders/engine/libraw_engine.hpp"

#include <libraw/libraw_const.h>

#include <iostream>
#include <memory>
#include <new>

namespace rawpress {
auto LibRawEngine::Shared() -> std::shared_ptr<DecodeEngine> {
  static const std::shared_ptr<DecodeEngine> engine = std::make_shared<LibRawEngine>();
  return engine;
}

auto LibRawEngine::Open(const void* buffer, size_t size, engine_status_t& status) -> LibRaw* {
  std::unique_ptr<LibRaw> processor;
  try {
    processor = std::make_unique<LibRaw>();
  } catch (const std::bad_alloc&) {
    std::cerr << "LibRawEngine: unable to allocate decoder state" << std::endl;
    status = LIBRAW_UNSUFFICIENT_MEMORY;
    return nullptr;
  }

  status = processor->open_buffer(buffer, size);
  if (status != LIBRAW_SUCCESS) {
    return nullptr;
  }
  return processor.release();
}

void LibRawEngine::Configure(LibRaw& processor, const DecoderOptions& options) {
  processor.imgdata.rawparams.use_rawspeed      = options.use_rawspeed ? 1 : 0;
  processor.imgdata.rawparams.max_raw_memory_mb = options.max_raw_memory_mb;
}

auto LibRawEngine::Unpack(LibRaw& processor) -> engine_status_t { return processor.unpack(); }

auto LibRawEngine::UnpackThumbnail(LibRaw& processor, thumb_index_t index) -> engine_status_t {
  return processor.unpack_thumb_ex(index);
}

auto LibRawEngine::RunPipeline(LibRaw& processor, BitDepth depth) -> engine_status_t {
  processor.imgdata.params.output_bps = BitsOf(depth);
  return processor.dcraw_process();
}

auto LibRawEngine::MaterializeImage(LibRaw& processor, engine_status_t& status)
    -> libraw_processed_image_t* {
  status = LIBRAW_SUCCESS;
  return processor.dcraw_make_mem_image(&status);
}

void LibRawEngine::ReleaseImage(libraw_processed_image_t* image) {
  if (image) {
    LibRaw::dcraw_clear_mem(image);
  }
}

void LibRawEngine::Close(LibRaw* processor) {
  // The destructor recycles every buffer the instance allocated
  std::unique_ptr<LibRaw> owned(processor);
}
};  // namespace rawpress

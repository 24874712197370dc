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

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "decoders/decode_error.hpp"
#include "decoders/decoder_options.hpp"
#include "decoders/engine/decode_engine.hpp"
#include "decoders/engine/libraw_engine.hpp"
#include "decoders/raw_pixel_view.hpp"
#include "image/metadata.hpp"
#include "image/processed_image.hpp"
#include "image/thumbnail_image.hpp"
#include "type/bit_depth.hpp"
#include "type/type.hpp"

namespace rawpress {
enum class DecoderStage : int { OPENED, UNPACKED };

/**
 * @brief Single owner of one native decoder instance.
 *
 * Open -> (Unpack ->) {metadata | ExtractThumbnails | Process}. Metadata is readable right
 * after Open and never changes afterwards. RawPixels and Process need Unpack first.
 *
 * A RawDecoder may be moved to another thread but must never be used from two threads at
 * once, the engine does no locking of its own. Wrap it in GuardedRawDecoder when it has to be
 * shared.
 */
class RawDecoder {
 public:
  /**
   * @brief Parse a raw container held in memory. The bytes are copied; the engine keeps
   * reading from them until the decoder is destroyed.
   *
   * @throw OpenError when the buffer is empty, not a supported container, or the engine cannot
   * allocate its state
   */
  static auto Open(std::span<const uint8_t> buffer, const DecoderOptions& options = {},
                   std::shared_ptr<DecodeEngine> engine = LibRawEngine::Shared()) -> RawDecoder;
  static auto Open(std::vector<uint8_t>&& buffer, const DecoderOptions& options = {},
                   std::shared_ptr<DecodeEngine> engine = LibRawEngine::Shared()) -> RawDecoder;
  static auto OpenFile(const image_path_t& path, const DecoderOptions& options = {},
                       std::shared_ptr<DecodeEngine> engine = LibRawEngine::Shared())
      -> RawDecoder;

  RawDecoder(RawDecoder&& other) noexcept;
  RawDecoder& operator=(RawDecoder&& other) noexcept;
  RawDecoder(const RawDecoder&)            = delete;
  RawDecoder& operator=(const RawDecoder&) = delete;
  ~RawDecoder();

  auto Stage() const -> DecoderStage;
  auto Options() const -> const DecoderOptions& { return options_; }

  /**
   * @brief Apply the configured engine options and decode the sensor data.
   *
   * @throw UnpackError on corrupt or unsupported pixel data; the decoder stays OPENED
   */
  void Unpack();

  /**
   * @brief Decode and copy out every embedded thumbnail in index order. Stops at the first
   * index the engine fails on and throws ThumbnailError; thumbnails copied before it are
   * discarded.
   */
  auto ExtractThumbnails() -> ThumbnailCollection;

  // Metadata, readable in any stage
  auto Width() const -> uint32_t;
  auto Height() const -> uint32_t;
  auto Pixels() const -> uint64_t;
  auto Colors() const -> int;
  auto IsoSpeed() const -> uint32_t;
  auto Shutter() const -> float;
  auto Aperture() const -> float;
  auto FocalLength() const -> float;
  auto DateTime() const -> std::optional<CaptureTime>;
  auto Gps() const -> GpsInfo;
  auto Artist() const -> std::string;
  auto Description() const -> std::string;
  auto Make() const -> std::string;
  auto Model() const -> std::string;
  auto NormalizedMake() const -> std::string;
  auto NormalizedModel() const -> std::string;
  auto Software() const -> std::string;
  auto RawCount() const -> uint32_t;
  auto DngVersion() const -> uint32_t;
  auto Lens() const -> LensInfo;
  auto Filters() const -> uint32_t;
  auto ChannelDescription() const -> std::string;
  auto ThumbnailCount() const -> int;
  auto FullInfo() const -> FullRawInfo;

  auto RawWidth() const -> uint32_t;
  auto RawHeight() const -> uint32_t;

  /**
   * @brief Borrow the unpacked CFA plane. Sensors without a single-plane buffer yield an empty
   * view.
   *
   * @throw LifecycleError before Unpack
   */
  auto RawPixels() const -> RawPixelView;

  /**
   * @brief Run the develop pipeline at the requested depth and materialize the result
   *
   * @throw InvalidBitDepthError for anything but 8 or 16, before the engine is touched
   * @throw LifecycleError before Unpack
   * @throw ProcessError, MaterializeError
   */
  auto Process(BitDepth depth) -> ProcessedImageBuffer;

  template <BitDepth D>
  auto Process() -> ProcessedImage<D> {
    static_assert(IsSupportedBitDepth(D), "Process only supports 8 or 16 bit output");
    return ProcessedImage<D>(Process(D));
  }

 private:
  struct ProcessorCloser {
    std::shared_ptr<DecodeEngine> engine_;
    void                          operator()(LibRaw* processor) const {
      if (processor && engine_) engine_->Close(processor);
    }
  };

  RawDecoder(std::shared_ptr<DecodeEngine> engine, std::vector<uint8_t>&& buffer,
             const DecoderOptions& options);

  auto Data() const -> const libraw_data_t&;
  auto Processor() -> LibRaw&;
  void RequireUnpacked(const char* operation) const;
  // Bump the generation so every outstanding RawPixelView turns stale
  void Invalidate();
  void Release() noexcept;

  std::shared_ptr<DecodeEngine>              engine_;
  // Must outlive processor_, the engine reads from it lazily
  std::vector<uint8_t>                       buffer_;
  std::unique_ptr<LibRaw, ProcessorCloser>   processor_;
  DecoderOptions                             options_;
  DecoderStage                               stage_ = DecoderStage::OPENED;
  std::shared_ptr<std::atomic<generation_t>> generation_;
};
};  // namespace rawpress

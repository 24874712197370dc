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


#include "decoders/raw_decoder.hpp"

#include <easy/profiler.h>
#include <libraw/libraw_const.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "image/metadata_extractor.hpp"
#include "utils/string/convert.hpp"

namespace rawpress {
RawDecoder::RawDecoder(std::shared_ptr<DecodeEngine> engine, std::vector<uint8_t>&& buffer,
                       const DecoderOptions& options)
    : engine_(std::move(engine)),
      buffer_(std::move(buffer)),
      processor_(nullptr, ProcessorCloser{engine_}),
      options_(options),
      generation_(std::make_shared<std::atomic<generation_t>>(0)) {}

auto RawDecoder::Open(std::span<const uint8_t> buffer, const DecoderOptions& options,
                      std::shared_ptr<DecodeEngine> engine) -> RawDecoder {
  return Open(std::vector<uint8_t>(buffer.begin(), buffer.end()), options, std::move(engine));
}

auto RawDecoder::Open(std::vector<uint8_t>&& buffer, const DecoderOptions& options,
                      std::shared_ptr<DecodeEngine> engine) -> RawDecoder {
  if (!engine) {
    throw std::invalid_argument("RawDecoder: a decode engine is required");
  }
  options.Validate();
  if (buffer.empty()) {
    throw OpenError(LIBRAW_IO_ERROR);
  }

  EASY_FUNCTION();
  RawDecoder      decoder(std::move(engine), std::move(buffer), options);
  engine_status_t status = LIBRAW_SUCCESS;
  decoder.processor_.reset(
      decoder.engine_->Open(decoder.buffer_.data(), decoder.buffer_.size(), status));
  if (status != LIBRAW_SUCCESS) {
    throw OpenError(status);
  }
  if (!decoder.processor_) {
    throw OpenError(LIBRAW_UNSPECIFIED_ERROR);
  }
  return decoder;
}

auto RawDecoder::OpenFile(const image_path_t& path, const DecoderOptions& options,
                          std::shared_ptr<DecodeEngine> engine) -> RawDecoder {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw OpenError(LIBRAW_IO_ERROR);
  }
  std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(ifs)),
                              std::istreambuf_iterator<char>());
  if (ifs.bad()) {
    throw OpenError(LIBRAW_IO_ERROR);
  }
  return Open(std::move(buffer), options, std::move(engine));
}

RawDecoder::RawDecoder(RawDecoder&& other) noexcept
    : engine_(std::move(other.engine_)),
      buffer_(std::move(other.buffer_)),
      processor_(std::move(other.processor_)),
      options_(other.options_),
      stage_(other.stage_),
      generation_(std::move(other.generation_)) {}

RawDecoder& RawDecoder::operator=(RawDecoder&& other) noexcept {
  if (this != &other) {
    // Close the old instance before the bytes it reads from go away
    Release();
    engine_     = std::move(other.engine_);
    buffer_     = std::move(other.buffer_);
    processor_  = std::move(other.processor_);
    options_    = other.options_;
    stage_      = other.stage_;
    generation_ = std::move(other.generation_);
  }
  return *this;
}

RawDecoder::~RawDecoder() { Release(); }

void RawDecoder::Release() noexcept {
  Invalidate();
  processor_.reset();
  buffer_.clear();
}

void RawDecoder::Invalidate() {
  if (generation_) {
    generation_->fetch_add(1, std::memory_order_acq_rel);
  }
}

auto RawDecoder::Data() const -> const libraw_data_t& {
  if (!processor_) {
    throw LifecycleError("RawDecoder: the decoder was moved from");
  }
  return processor_->imgdata;
}

auto RawDecoder::Processor() -> LibRaw& {
  if (!processor_) {
    throw LifecycleError("RawDecoder: the decoder was moved from");
  }
  return *processor_;
}

void RawDecoder::RequireUnpacked(const char* operation) const {
  if (!processor_) {
    throw LifecycleError("RawDecoder: the decoder was moved from");
  }
  if (stage_ != DecoderStage::UNPACKED) {
    throw LifecycleError(std::format("RawDecoder: {} requires Unpack() first", operation));
  }
}

auto RawDecoder::Stage() const -> DecoderStage { return stage_; }

void RawDecoder::Unpack() {
  EASY_BLOCK("LibRaw Unpacking");
  LibRaw& processor = Processor();
  Invalidate();
  // A failed re-unpack leaves the engine's pixel buffers undefined
  stage_ = DecoderStage::OPENED;

  engine_->Configure(processor, options_);
  CheckStatus(DecodeStage::UNPACK, engine_->Unpack(processor));
  stage_ = DecoderStage::UNPACKED;
  EASY_END_BLOCK;
}

auto RawDecoder::ExtractThumbnails() -> ThumbnailCollection {
  EASY_BLOCK("LibRaw Thumbnail Extraction");
  LibRaw& processor = Processor();
  Invalidate();

  const int           count = ThumbnailCount();
  ThumbnailCollection thumbnails;
  thumbnails.Reserve(static_cast<size_t>(count));
  for (thumb_index_t i = 0; i < count; ++i) {
    const engine_status_t status = engine_->UnpackThumbnail(processor, i);
    if (status != LIBRAW_SUCCESS) {
      throw ThumbnailError(i, status);
    }
    thumbnails.Append(ThumbnailImage::FromLibRaw(processor.imgdata.thumbnail));
  }
  EASY_END_BLOCK;
  return thumbnails;
}

auto RawDecoder::Width() const -> uint32_t { return Data().sizes.width; }

auto RawDecoder::Height() const -> uint32_t { return Data().sizes.height; }

auto RawDecoder::Pixels() const -> uint64_t { return static_cast<uint64_t>(Width()) * Height(); }

auto RawDecoder::Colors() const -> int { return Data().idata.colors; }

auto RawDecoder::IsoSpeed() const -> uint32_t {
  const float iso = Data().other.iso_speed;
  if (!std::isfinite(iso) || iso <= 0.0f) {
    return 0;
  }
  return static_cast<uint32_t>(std::lround(iso));
}

auto RawDecoder::Shutter() const -> float { return Data().other.shutter; }

auto RawDecoder::Aperture() const -> float { return Data().other.aperture; }

auto RawDecoder::FocalLength() const -> float { return Data().other.focal_len; }

auto RawDecoder::DateTime() const -> std::optional<CaptureTime> {
  return MetadataExtractor::CaptureTimeFromEpoch(Data().other.timestamp);
}

auto RawDecoder::Gps() const -> GpsInfo {
  return MetadataExtractor::GpsFromLibRaw(Data().other.parsed_gps);
}

auto RawDecoder::Artist() const -> std::string { return conv::FromFixedBuffer(Data().other.artist); }

auto RawDecoder::Description() const -> std::string {
  return conv::TrimAscii(conv::FromFixedBuffer(Data().other.desc));
}

auto RawDecoder::Make() const -> std::string { return conv::FromFixedBuffer(Data().idata.make); }

auto RawDecoder::Model() const -> std::string { return conv::FromFixedBuffer(Data().idata.model); }

auto RawDecoder::NormalizedMake() const -> std::string {
  return conv::FromFixedBuffer(Data().idata.normalized_make);
}

auto RawDecoder::NormalizedModel() const -> std::string {
  return conv::FromFixedBuffer(Data().idata.normalized_model);
}

auto RawDecoder::Software() const -> std::string {
  return conv::FromFixedBuffer(Data().idata.software);
}

auto RawDecoder::RawCount() const -> uint32_t { return Data().idata.raw_count; }

auto RawDecoder::DngVersion() const -> uint32_t { return Data().idata.dng_version; }

auto RawDecoder::Lens() const -> LensInfo { return MetadataExtractor::LensFromLibRaw(Data().lens); }

auto RawDecoder::Filters() const -> uint32_t { return Data().idata.filters; }

auto RawDecoder::ChannelDescription() const -> std::string {
  return conv::FromFixedBuffer(Data().idata.cdesc);
}

auto RawDecoder::ThumbnailCount() const -> int {
  return std::clamp(Data().thumbs_list.thumbcount, 0, LIBRAW_THUMBNAIL_MAXCOUNT);
}

auto RawDecoder::FullInfo() const -> FullRawInfo {
  FullRawInfo info;
  info.width            = Width();
  info.height           = Height();
  info.colors           = Colors();
  info.iso_speed        = IsoSpeed();
  info.shutter          = Shutter();
  info.aperture         = Aperture();
  info.focal_len        = FocalLength();
  info.datetime         = DateTime();
  info.gps              = Gps();
  info.artist           = Artist();
  info.desc             = Description();
  info.make             = Make();
  info.model            = Model();
  info.normalized_make  = NormalizedMake();
  info.normalized_model = NormalizedModel();
  info.software         = Software();
  info.raw_count        = RawCount();
  info.dng_version      = DngVersion();
  info.lens_info        = Lens();
  return info;
}

auto RawDecoder::RawWidth() const -> uint32_t { return Data().sizes.raw_width; }

auto RawDecoder::RawHeight() const -> uint32_t { return Data().sizes.raw_height; }

auto RawDecoder::RawPixels() const -> RawPixelView {
  RequireUnpacked("RawPixels");
  const auto& data = Data();
  if (!data.rawdata.raw_image) {
    return {};
  }
  return RawPixelView(data.rawdata.raw_image, data.sizes.raw_width, data.sizes.raw_height,
                      generation_, generation_->load(std::memory_order_acquire));
}

auto RawDecoder::Process(BitDepth depth) -> ProcessedImageBuffer {
  ValidateBitDepth(depth);
  RequireUnpacked("Process");

  EASY_BLOCK("LibRaw Develop");
  LibRaw& processor = Processor();
  Invalidate();
  CheckStatus(DecodeStage::PROCESS, engine_->RunPipeline(processor, depth));

  engine_status_t status = LIBRAW_SUCCESS;
  // Owned from here on, released even if the checks below throw
  ProcessedImageBuffer image(engine_, engine_->MaterializeImage(processor, status));
  CheckStatus(DecodeStage::MATERIALIZE, status);
  if (image.Empty()) {
    throw MaterializeError(LIBRAW_UNSPECIFIED_ERROR, "engine returned no image");
  }
  if (image.Bits() != BitsOf(depth)) {
    throw MaterializeError(LIBRAW_UNSPECIFIED_ERROR,
                           std::format("engine produced {} bit samples, {} were requested",
                                       image.Bits(), BitsOf(depth)));
  }
  EASY_END_BLOCK;
  return image;
}
};  // namespace rawpress

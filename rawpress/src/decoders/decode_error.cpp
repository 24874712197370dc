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

#include "decoders/decode_error.hpp"

#include <libraw/libraw.h>

#include <format>

namespace rawpress {
namespace {
auto EngineMessage(engine_status_t status) -> std::string {
  const char* msg = LibRaw::strerror(status);
  return msg ? std::string(msg) : std::string("Unknown error");
}

auto ComposeMessage(DecodeStage stage, engine_status_t status, const std::string& detail)
    -> std::string {
  std::string message = std::format("RawDecoder: {} failed: {} (error {})",
                                    DecodeStageName(stage), EngineMessage(status), status);
  if (!detail.empty()) {
    message += ": " + detail;
  }
  return message;
}
}  // namespace

auto ClassifyStatus(engine_status_t status) -> ErrorKind {
  if (status > 0) {
    return ErrorKind::SYSTEM_ERROR;
  }
  switch (status) {
    case LIBRAW_FILE_UNSUPPORTED:
      return ErrorKind::FILE_UNSUPPORTED;
    case LIBRAW_REQUEST_FOR_NONEXISTENT_IMAGE:
      return ErrorKind::NONEXISTENT_IMAGE;
    case LIBRAW_OUT_OF_ORDER_CALL:
      return ErrorKind::OUT_OF_ORDER_CALL;
    case LIBRAW_NO_THUMBNAIL:
      return ErrorKind::NO_THUMBNAIL;
    case LIBRAW_UNSUPPORTED_THUMBNAIL:
      return ErrorKind::UNSUPPORTED_THUMBNAIL;
    case LIBRAW_INPUT_CLOSED:
      return ErrorKind::INPUT_CLOSED;
    case LIBRAW_NOT_IMPLEMENTED:
      return ErrorKind::NOT_IMPLEMENTED;
    case LIBRAW_REQUEST_FOR_NONEXISTENT_THUMBNAIL:
      return ErrorKind::NONEXISTENT_THUMBNAIL;
    case LIBRAW_UNSUFFICIENT_MEMORY:
      return ErrorKind::INSUFFICIENT_MEMORY;
    case LIBRAW_DATA_ERROR:
      return ErrorKind::DATA_ERROR;
    case LIBRAW_IO_ERROR:
      return ErrorKind::IO_ERROR;
    case LIBRAW_CANCELLED_BY_CALLBACK:
      return ErrorKind::CANCELLED_BY_CALLBACK;
    case LIBRAW_BAD_CROP:
      return ErrorKind::BAD_CROP;
    case LIBRAW_TOO_BIG:
      return ErrorKind::TOO_BIG;
    case LIBRAW_MEMPOOL_OVERFLOW:
      return ErrorKind::MEMPOOL_OVERFLOW;
    default:
      return ErrorKind::UNSPECIFIED;
  }
}

auto ErrorKindName(ErrorKind kind) -> const char* {
  switch (kind) {
    case ErrorKind::UNSPECIFIED:
      return "unspecified";
    case ErrorKind::FILE_UNSUPPORTED:
      return "file_unsupported";
    case ErrorKind::NONEXISTENT_IMAGE:
      return "nonexistent_image";
    case ErrorKind::OUT_OF_ORDER_CALL:
      return "out_of_order_call";
    case ErrorKind::NO_THUMBNAIL:
      return "no_thumbnail";
    case ErrorKind::UNSUPPORTED_THUMBNAIL:
      return "unsupported_thumbnail";
    case ErrorKind::INPUT_CLOSED:
      return "input_closed";
    case ErrorKind::NOT_IMPLEMENTED:
      return "not_implemented";
    case ErrorKind::NONEXISTENT_THUMBNAIL:
      return "nonexistent_thumbnail";
    case ErrorKind::INSUFFICIENT_MEMORY:
      return "insufficient_memory";
    case ErrorKind::DATA_ERROR:
      return "data_error";
    case ErrorKind::IO_ERROR:
      return "io_error";
    case ErrorKind::CANCELLED_BY_CALLBACK:
      return "cancelled_by_callback";
    case ErrorKind::BAD_CROP:
      return "bad_crop";
    case ErrorKind::TOO_BIG:
      return "too_big";
    case ErrorKind::MEMPOOL_OVERFLOW:
      return "mempool_overflow";
    case ErrorKind::SYSTEM_ERROR:
      return "system_error";
  }
  return "unspecified";
}

auto DecodeStageName(DecodeStage stage) -> const char* {
  switch (stage) {
    case DecodeStage::OPEN:
      return "open";
    case DecodeStage::UNPACK:
      return "unpack";
    case DecodeStage::THUMBNAIL:
      return "thumbnail";
    case DecodeStage::PROCESS:
      return "process";
    case DecodeStage::MATERIALIZE:
      return "materialize";
  }
  return "unknown";
}

RawError::RawError(DecodeStage stage, engine_status_t status, const std::string& detail)
    : std::runtime_error(ComposeMessage(stage, status, detail)),
      stage_(stage),
      status_(status),
      kind_(ClassifyStatus(status)) {}

OpenError::OpenError(engine_status_t status) : RawError(DecodeStage::OPEN, status, {}) {}

UnpackError::UnpackError(engine_status_t status) : RawError(DecodeStage::UNPACK, status, {}) {}

ThumbnailError::ThumbnailError(thumb_index_t index, engine_status_t status)
    : RawError(DecodeStage::THUMBNAIL, status, std::format("thumbnail #{}", index)),
      index_(index) {}

ProcessError::ProcessError(engine_status_t status) : RawError(DecodeStage::PROCESS, status, {}) {}

MaterializeError::MaterializeError(engine_status_t status)
    : RawError(DecodeStage::MATERIALIZE, status, {}) {}

MaterializeError::MaterializeError(engine_status_t status, const std::string& detail)
    : RawError(DecodeStage::MATERIALIZE, status, detail) {}

InvalidBitDepthError::InvalidBitDepthError(int bits)
    : std::invalid_argument(
          std::format("RawDecoder: unsupported output bit depth {}, expected 8 or 16", bits)) {}

StalePixelViewError::StalePixelViewError()
    : std::logic_error(
          "RawPixelView: the owning decoder was mutated or destroyed after this view was taken") {}

void CheckStatus(DecodeStage stage, engine_status_t status) {
  if (status == LIBRAW_SUCCESS) {
    return;
  }
  switch (stage) {
    case DecodeStage::OPEN:
      throw OpenError(status);
    case DecodeStage::UNPACK:
      throw UnpackError(status);
    case DecodeStage::PROCESS:
      throw ProcessError(status);
    case DecodeStage::MATERIALIZE:
      throw MaterializeError(status);
    case DecodeStage::THUMBNAIL:
      // Thumbnail failures need the index, callers throw ThumbnailError directly
      throw RawError(stage, status, {});
  }
  throw RawError(stage, status, {});
}
};  // namespace rawpress

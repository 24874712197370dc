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

#include <stdexcept>
#include <string>

#include "type/type.hpp"

namespace rawpress {
/**
 * @brief Classification of a non-success engine status. Negative LibRaw_errors values map
 * one-to-one, positive values are errno codes reported by the engine's data stream.
 */
enum class ErrorKind : int {
  UNSPECIFIED,
  FILE_UNSUPPORTED,
  NONEXISTENT_IMAGE,
  OUT_OF_ORDER_CALL,
  NO_THUMBNAIL,
  UNSUPPORTED_THUMBNAIL,
  INPUT_CLOSED,
  NOT_IMPLEMENTED,
  NONEXISTENT_THUMBNAIL,
  INSUFFICIENT_MEMORY,
  DATA_ERROR,
  IO_ERROR,
  CANCELLED_BY_CALLBACK,
  BAD_CROP,
  TOO_BIG,
  MEMPOOL_OVERFLOW,
  SYSTEM_ERROR
};

enum class DecodeStage : int { OPEN, UNPACK, THUMBNAIL, PROCESS, MATERIALIZE };

auto ClassifyStatus(engine_status_t status) -> ErrorKind;
auto ErrorKindName(ErrorKind kind) -> const char*;
auto DecodeStageName(DecodeStage stage) -> const char*;

/**
 * @brief Base of every failure reported by the decode engine
 */
class RawError : public std::runtime_error {
 public:
  RawError(DecodeStage stage, engine_status_t status, const std::string& detail);

  auto Stage() const -> DecodeStage { return stage_; }
  auto Status() const -> engine_status_t { return status_; }
  auto Kind() const -> ErrorKind { return kind_; }

 private:
  DecodeStage     stage_;
  engine_status_t status_;
  ErrorKind       kind_;
};

class OpenError : public RawError {
 public:
  explicit OpenError(engine_status_t status);
};

class UnpackError : public RawError {
 public:
  explicit UnpackError(engine_status_t status);
};

class ThumbnailError : public RawError {
 public:
  ThumbnailError(thumb_index_t index, engine_status_t status);

  auto Index() const -> thumb_index_t { return index_; }

 private:
  thumb_index_t index_;
};

class ProcessError : public RawError {
 public:
  explicit ProcessError(engine_status_t status);
};

class MaterializeError : public RawError {
 public:
  explicit MaterializeError(engine_status_t status);
  MaterializeError(engine_status_t status, const std::string& detail);
};

// Contract violations, never caused by the content of the raw file

class InvalidBitDepthError : public std::invalid_argument {
 public:
  explicit InvalidBitDepthError(int bits);
};

class LifecycleError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

class StalePixelViewError : public std::logic_error {
 public:
  StalePixelViewError();
};

/**
 * @brief Throw the stage-specific RawError when status is not LIBRAW_SUCCESS
 */
void CheckStatus(DecodeStage stage, engine_status_t status);
};  // namespace rawpress

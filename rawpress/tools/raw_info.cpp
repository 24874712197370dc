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


#include <easy/profiler.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "decoders/decode_error.hpp"
#include "decoders/decoder_options.hpp"
#include "decoders/raw_decoder.hpp"
#include "image/thumbnail_image.hpp"
#include "type/bit_depth.hpp"
#include "type/supported_file_type.hpp"

namespace {
struct CliArgs {
  std::string                raw_path;
  bool                       thumbs = false;
  std::optional<int>         process_bits;
  std::optional<std::string> config_path;
  std::optional<std::string> profile_path;
};

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " <file> [--thumbs] [--process 8|16] [--config <options.json>]"
               " [--profile <out.prof>]\n";
}

auto ParseArgs(int argc, char** argv) -> std::optional<CliArgs> {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--thumbs") {
      args.thumbs = true;
    } else if (arg == "--process" && i + 1 < argc) {
      try {
        args.process_bits = std::stoi(argv[++i]);
      } catch (const std::exception&) {
        std::cerr << "rawpress_info: --process expects 8 or 16\n";
        return std::nullopt;
      }
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--profile" && i + 1 < argc) {
      args.profile_path = argv[++i];
    } else if (!arg.starts_with("--") && args.raw_path.empty()) {
      args.raw_path = arg;
    } else {
      std::cerr << "rawpress_info: unexpected argument " << arg << "\n";
      return std::nullopt;
    }
  }
  if (args.raw_path.empty()) {
    return std::nullopt;
  }
  return args;
}

auto Run(const CliArgs& args) -> int {
  rawpress::DecoderOptions options;
  if (args.config_path) {
    options = rawpress::DecoderOptions::LoadFromFile(*args.config_path);
  }

  if (!rawpress::is_supported_file(args.raw_path)) {
    std::cerr << "rawpress_info: " << args.raw_path
              << " does not look like a camera raw file, trying anyway" << std::endl;
  }
  auto decoder = rawpress::RawDecoder::OpenFile(args.raw_path, options);
  std::cout << decoder.FullInfo().ToJson().dump(2) << std::endl;

  if (args.thumbs) {
    auto thumbnails = decoder.ExtractThumbnails();
    std::cout << "thumbnails: " << thumbnails.Size() << std::endl;
    size_t index = 0;
    for (const auto& thumbnail : thumbnails) {
      std::cout << "  [" << index++ << "] " << rawpress::ThumbnailFormatName(thumbnail.format)
                << " " << thumbnail.width << "x" << thumbnail.height << " "
                << thumbnail.data.size() << " bytes" << std::endl;
    }
  }

  if (args.process_bits) {
    const auto depth = rawpress::ToBitDepth(*args.process_bits);
    decoder.Unpack();
    auto image = decoder.Process(depth);
    std::cout << "processed: " << image.Width() << "x" << image.Height() << " "
              << image.Colors() << " colors, " << image.Bits() << " bits, "
              << rawpress::ImageFormatName(image.GetFormat()) << ", " << image.DataSize()
              << " bytes" << std::endl;
  }
  return EXIT_SUCCESS;
}
}  // namespace

int main(int argc, char** argv) {
  auto args = ParseArgs(argc, argv);
  if (!args) {
    PrintUsage(argv[0]);
    return 2;
  }

  if (args->profile_path) {
    EASY_PROFILER_ENABLE;
  }

  int code = EXIT_FAILURE;
  try {
    code = Run(*args);
  } catch (const rawpress::RawError& e) {
    std::cerr << "rawpress_info: " << e.what() << std::endl;
  } catch (const std::logic_error& e) {
    std::cerr << "rawpress_info: " << e.what() << std::endl;
  } catch (const std::runtime_error& e) {
    std::cerr << "rawpress_info: " << e.what() << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "rawpress_info: unexpected failure: " << e.what() << std::endl;
  }

  if (args->profile_path) {
    profiler::dumpBlocksToFile(args->profile_path->c_str());
  }
  return code;
}

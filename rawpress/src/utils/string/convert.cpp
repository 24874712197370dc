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

#include "utils/string/convert.hpp"

#include <utf8.h>

#include <cctype>
#include <cstring>
#include <iterator>

namespace conv {
namespace {
auto IsTrimmable(char c) -> bool {
  return c == '\0' || std::isspace(static_cast<unsigned char>(c));
}
}  // namespace

auto FromFixedBuffer(const char* buffer, size_t capacity) -> std::string {
  if (!buffer || capacity == 0) {
    return {};
  }
  // strnlen never reads past capacity, the engine does not promise a terminator
  const size_t len = strnlen(buffer, capacity);
  return ToValidUtf8(std::string_view(buffer, len));
}

auto ToValidUtf8(std::string_view bytes) -> std::string {
  std::string out;
  out.reserve(bytes.size());
  utf8::replace_invalid(bytes.begin(), bytes.end(), std::back_inserter(out));
  return out;
}

auto TrimAscii(std::string_view value) -> std::string {
  size_t begin = 0;
  size_t end   = value.size();
  while (begin < end && IsTrimmable(value[begin])) {
    ++begin;
  }
  while (end > begin && IsTrimmable(value[end - 1])) {
    --end;
  }
  return std::string(value.substr(begin, end - begin));
}
};  // namespace conv

/*
 * Copyright 2025 LiveKit
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an “AS IS” BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "payload_codec.h"

#include <zlib.h>

#include <limits>

#include "meetbridge/decode_error.h"

namespace meetbridge {

namespace {

constexpr std::uint8_t kInvalid = 0xFF;

std::uint8_t base64Value(char c) {
  if (c >= 'A' && c <= 'Z') {
    return static_cast<std::uint8_t>(c - 'A');
  }
  if (c >= 'a' && c <= 'z') {
    return static_cast<std::uint8_t>(c - 'a' + 26);
  }
  if (c >= '0' && c <= '9') {
    return static_cast<std::uint8_t>(c - '0' + 52);
  }
  if (c == '+') {
    return 62;
  }
  if (c == '/') {
    return 63;
  }
  return kInvalid;
}

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

[[noreturn]] void invalid(const std::string &what) {
  throw DecodeError(DecodeError::ErrorCode::INVALID_PAYLOAD_ENCODING, what);
}

} // namespace

std::vector<std::uint8_t> base64Decode(const std::string &encoded) {
  std::vector<std::uint8_t> result;
  result.reserve(encoded.size() * 3 / 4);

  std::uint32_t buffer = 0;
  int bits = 0;
  std::size_t symbols = 0;
  std::size_t padding = 0;

  for (char c : encoded) {
    if (isSpace(c)) {
      continue;
    }
    if (c == '=') {
      ++padding;
      continue;
    }
    if (padding > 0) {
      invalid("base64: data after padding");
    }
    const std::uint8_t val = base64Value(c);
    if (val == kInvalid) {
      invalid("base64: invalid character");
    }
    ++symbols;
    buffer = (buffer << 6) | val;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      result.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFF));
    }
  }

  if (symbols % 4 == 1 || padding > 2 ||
      (padding > 0 && (symbols + padding) % 4 != 0)) {
    invalid("base64: bad length");
  }
  return result;
}

std::vector<std::uint8_t> inflatePayload(const std::uint8_t *data,
                                         std::size_t size,
                                         std::size_t max_output) {
  if (size > std::numeric_limits<uInt>::max()) {
    invalid("inflate: input too large");
  }

  z_stream stream{};
  if (inflateInit(&stream) != Z_OK) {
    invalid("inflate: init failed");
  }

  stream.next_in = const_cast<Bytef *>(data);
  stream.avail_in = static_cast<uInt>(size);

  std::vector<std::uint8_t> out;
  std::uint8_t chunk[16384];
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    stream.next_out = chunk;
    stream.avail_out = sizeof(chunk);
    rc = inflate(&stream, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      const std::string msg = stream.msg ? stream.msg : "corrupt stream";
      inflateEnd(&stream);
      invalid("inflate: " + msg);
    }
    const std::size_t produced = sizeof(chunk) - stream.avail_out;
    if (out.size() + produced > max_output) {
      inflateEnd(&stream);
      invalid("inflate: output exceeds limit");
    }
    out.insert(out.end(), chunk, chunk + produced);
    if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      inflateEnd(&stream);
      invalid("inflate: truncated stream");
    }
  }

  inflateEnd(&stream);
  return out;
}

} // namespace meetbridge

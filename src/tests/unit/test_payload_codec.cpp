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
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "common/test_common.h"
#include "payload_codec.h"

#include <functional>

namespace meetbridge {
namespace test {

namespace {

std::string asString(const std::vector<std::uint8_t> &bytes) {
  return std::string(bytes.begin(), bytes.end());
}

DecodeError::ErrorCode codeOf(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const DecodeError &e) {
    return e.code();
  }
  ADD_FAILURE() << "Expected a DecodeError";
  return DecodeError::ErrorCode::SHORT_READ;
}

} // namespace

TEST(PayloadCodecTest, Base64DecodesPaddedAndUnpadded) {
  EXPECT_EQ(asString(base64Decode("aGVsbG8=")), "hello");
  EXPECT_EQ(asString(base64Decode("aGVsbG8")), "hello");
  EXPECT_EQ(asString(base64Decode("aGk=")), "hi");
  EXPECT_EQ(asString(base64Decode("")), "");
}

TEST(PayloadCodecTest, Base64IgnoresWhitespace) {
  EXPECT_EQ(asString(base64Decode("aGVs\nbG8g\r\nd29y bGQ=")), "hello world");
}

TEST(PayloadCodecTest, Base64MatchesEncoderOnBinary) {
  std::string binary;
  for (int i = 0; i < 256; ++i) {
    binary.push_back(static_cast<char>(i));
  }
  EXPECT_EQ(asString(base64Decode(base64Encode(binary))), binary);
}

TEST(PayloadCodecTest, Base64RejectsGarbage) {
  EXPECT_EQ(codeOf([] { base64Decode("ab$d"); }),
            DecodeError::ErrorCode::INVALID_PAYLOAD_ENCODING);
  EXPECT_EQ(codeOf([] { base64Decode("aGk=aGk="); }),
            DecodeError::ErrorCode::INVALID_PAYLOAD_ENCODING)
      << "Data after padding";
  EXPECT_EQ(codeOf([] { base64Decode("a"); }),
            DecodeError::ErrorCode::INVALID_PAYLOAD_ENCODING);
}

TEST(PayloadCodecTest, InflateRestoresDeflatedPayload) {
  const std::string original(10000, 'm');
  const auto deflated = deflateBytes(original);
  ASSERT_LT(deflated.size(), original.size());

  const auto inflated = inflatePayload(deflated.data(), deflated.size());

  EXPECT_EQ(asString(inflated), original);
}

TEST(PayloadCodecTest, InflateRejectsCorruptAndTruncatedStreams) {
  const std::vector<std::uint8_t> junk = {0x00, 0x11, 0x22, 0x33};
  EXPECT_EQ(codeOf([&] { inflatePayload(junk.data(), junk.size()); }),
            DecodeError::ErrorCode::INVALID_PAYLOAD_ENCODING);

  auto deflated = deflateBytes(std::string(5000, 'x') + "tail");
  deflated.resize(deflated.size() / 2);
  EXPECT_EQ(codeOf([&] { inflatePayload(deflated.data(), deflated.size()); }),
            DecodeError::ErrorCode::INVALID_PAYLOAD_ENCODING);
}

TEST(PayloadCodecTest, InflateEnforcesOutputLimit) {
  const auto deflated = deflateBytes(std::string(4096, 'z'));
  EXPECT_EQ(
      codeOf([&] { inflatePayload(deflated.data(), deflated.size(), 1024); }),
      DecodeError::ErrorCode::INVALID_PAYLOAD_ENCODING);
}

} // namespace test
} // namespace meetbridge

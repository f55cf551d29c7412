#include "devbar/decompression-cascade.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>

#include "devbar/codec-registry.hpp"
#include "devbar/decode-outcome.hpp"
#include "devbar/decoder.hpp"
#include "devbar/encoding-stack.hpp"
#include "devbar/encoding.hpp"
#include "devbar/raw-chars.hpp"
#include "log-capture.hpp"

namespace devbar {

namespace {

constexpr std::string_view kHtml = "<html><body>Hi</body></html>";
constexpr std::size_t kMaxBytes = 1UL << 20;
constexpr std::size_t kChunkSize = 256;

std::string Encode(Encoding encoding, std::string_view plain) {
  RawChars out;
  CodecRegistry::Global().encode(encoding, plain, out);
  return std::string(std::string_view(out));
}

DecodeOutcome RunCascade(std::string_view contentEncoding, std::string_view body,
                         const CodecRegistry &registry = CodecRegistry::Global(), std::size_t maxBytes = kMaxBytes) {
  return DecompressionCascade::Run(EncodingStack::Parse(contentEncoding), body, registry,
                                   DecodeLimits{.maxDecodedBytes = maxBytes, .chunkSize = kChunkSize});
}

}  // namespace

TEST(DecompressionCascadeTest, EmptyStackIsPassThrough) {
  const auto outcome = RunCascade("", kHtml);
  EXPECT_EQ(outcome.kind(), DecodeOutcome::Kind::PassThrough);
  EXPECT_EQ(outcome.body().data(), kHtml.data());
  EXPECT_EQ(outcome.reason(), nullptr);

  EXPECT_EQ(RunCascade("identity", kHtml).kind(), DecodeOutcome::Kind::PassThrough);
}

TEST(DecompressionCascadeTest, SingleGzip) {
  const std::string compressed = Encode(Encoding::gzip, kHtml);
  const auto outcome = RunCascade("gzip", compressed);
  ASSERT_TRUE(outcome.decoded());
  EXPECT_EQ(outcome.body(), kHtml);
}

TEST(DecompressionCascadeTest, IdentityTokensAreNoOps) {
  const std::string compressed = Encode(Encoding::gzip, kHtml);
  const auto outcome = RunCascade("gzip, identity", compressed);
  ASSERT_TRUE(outcome.decoded());
  EXPECT_EQ(outcome.body(), kHtml);
  EXPECT_EQ(RunCascade("identity, GZIP", compressed).body(), kHtml);
}

TEST(DecompressionCascadeTest, StackIsDecodedInReverseOrder) {
  // The origin applied deflate first, then gzip.
  const std::string compressed = Encode(Encoding::gzip, Encode(Encoding::deflate, kHtml));
  const auto outcome = RunCascade("deflate, gzip", compressed);
  ASSERT_TRUE(outcome.decoded());
  EXPECT_EQ(outcome.body(), kHtml);

  EXPECT_TRUE(RunCascade("gzip, deflate", compressed).failed());
}

TEST(DecompressionCascadeTest, RoundTripEveryAvailableCodec) {
  const std::string payload = "<html><body>" + std::string(10000, 'r') + "caf\xC3\xA9</body></html>";
  for (const auto encoding : {Encoding::gzip, Encoding::deflate, Encoding::br, Encoding::zstd}) {
    if (!CodecRegistry::Global().isAvailable(encoding)) {
      continue;
    }
    SCOPED_TRACE(std::string(GetEncodingStr(encoding)));
    const auto outcome = RunCascade(GetEncodingStr(encoding), Encode(encoding, payload));
    ASSERT_TRUE(outcome.decoded());
    EXPECT_EQ(outcome.body(), payload);
  }
}

TEST(DecompressionCascadeTest, UnknownTokenAnywhereAbortsEverything) {
  const std::string compressed = Encode(Encoding::gzip, kHtml);
  for (std::string_view header : {"x-custom", "gzip, x-custom", "x-custom, gzip", "compress"}) {
    SCOPED_TRACE(header);
    const auto outcome = RunCascade(header, compressed);
    ASSERT_TRUE(outcome.failed());
    EXPECT_EQ(outcome.body(), compressed);
    EXPECT_STREQ(outcome.reason(), "unknown content coding");
  }
}

TEST(DecompressionCascadeTest, UnavailableCodecLogsAtDebugLevel) {
  const CodecRegistry registry{Encoding::zstd};
  const std::string body = "\x28\xB5\x2F\xFD not really zstd";

  test::LogCapture logs;
  const auto outcome = RunCascade("zstd", body, registry);
  ASSERT_TRUE(outcome.failed());
  EXPECT_EQ(outcome.body(), body);
  EXPECT_STREQ(outcome.reason(), "content coding not available");

  const std::string contents = logs.contents();
  EXPECT_NE(contents.find("debug"), std::string::npos) << contents;
  EXPECT_NE(contents.find("'zstd'"), std::string::npos) << contents;
}

TEST(DecompressionCascadeTest, UnavailableCodecIsNotPartiallyDecoded) {
  const CodecRegistry registry{Encoding::deflate};
  const std::string compressed = Encode(Encoding::gzip, Encode(Encoding::deflate, kHtml));
  const auto outcome = RunCascade("deflate, gzip", compressed, registry);
  ASSERT_TRUE(outcome.failed());
  EXPECT_EQ(outcome.body(), compressed);
}

TEST(DecompressionCascadeTest, CorruptedGzipIsPassedThrough) {
  std::string compressed = Encode(Encoding::gzip, std::string(2000, 'c'));
  compressed[compressed.size() / 2] ^= 0x5A;
  compressed[(compressed.size() / 2) + 1] ^= 0x5A;
  const auto outcome = RunCascade("gzip", compressed);
  ASSERT_TRUE(outcome.failed());
  EXPECT_EQ(outcome.body(), compressed);

  EXPECT_TRUE(RunCascade("gzip", "definitely not gzip").failed());
}

TEST(DecompressionCascadeTest, NonUtf8ResultIsPassedThrough) {
  const std::string compressed = Encode(Encoding::gzip, "\xFF\xFE binary");
  const auto outcome = RunCascade("gzip", compressed);
  ASSERT_TRUE(outcome.failed());
  EXPECT_EQ(outcome.body(), compressed);
  EXPECT_STREQ(outcome.reason(), "decoded body is not valid UTF-8");
}

TEST(DecompressionCascadeTest, DecodedSizeIsBounded) {
  const std::string compressed = Encode(Encoding::gzip, std::string(100000, 'b'));
  EXPECT_TRUE(RunCascade("gzip", compressed, CodecRegistry::Global(), 4096).failed());
  EXPECT_TRUE(RunCascade("gzip", compressed, CodecRegistry::Global(), 100000).decoded());
  EXPECT_TRUE(RunCascade("gzip", compressed, CodecRegistry::Global(), 0).decoded());
}

TEST(DecompressionCascadeTest, FailureResolvesToPassThrough) {
  const std::string body = "not gzip";
  auto outcome = RunCascade("gzip", body).resolved();
  EXPECT_EQ(outcome.kind(), DecodeOutcome::Kind::PassThrough);
  EXPECT_EQ(outcome.reason(), nullptr);
  EXPECT_EQ(outcome.body(), body);
}

}  // namespace devbar

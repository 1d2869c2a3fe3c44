#include <gtest/gtest.h>
#include "chunker/compress/compressor.hpp"
#include "test_utils.hpp"

using namespace chunker::compress;
using chunker::Bytes;

class CompressorTest : public ::testing::Test {
protected:
  static constexpr int LEVEL = 6;

  // Ratio placing floor(raw * (1 - ratio)) exactly at compressed_len + offset
  static double ratio_for(size_t raw_len, size_t compressed_len, double offset) {
    return (static_cast<double>(raw_len) - static_cast<double>(compressed_len) - offset) /
           static_cast<double>(raw_len);
  }
};

TEST_F(CompressorTest, EmptyInputStaysRaw) {
  CompressResult result = compress(Bytes{}, LEVEL, 0.02);
  EXPECT_EQ(result.stored_as, StoredAs::Raw);
  EXPECT_TRUE(result.payload.empty());
}

TEST_F(CompressorTest, CompressibleInputIsKept) {
  Bytes raw = compressible_bytes(64 * 1024);
  CompressResult result = compress(raw, LEVEL, 0.02);

  ASSERT_EQ(result.stored_as, StoredAs::Gzip);
  EXPECT_LT(result.payload.size(), raw.size() / 10);
  EXPECT_EQ(decompress(result.payload, result.stored_as), raw);
}

TEST_F(CompressorTest, RandomInputFallsBackToRaw) {
  Bytes raw = random_bytes(64 * 1024);
  CompressResult result = compress(raw, LEVEL, 0.02);

  EXPECT_EQ(result.stored_as, StoredAs::Raw);
  EXPECT_EQ(result.payload, raw);
  EXPECT_EQ(decompress(result.payload, result.stored_as), raw);
}

TEST_F(CompressorTest, GainThresholdBoundary) {
  Bytes raw = compressible_bytes(8192);
  const size_t compressed_len = gzip_compress(raw, LEVEL).size();
  ASSERT_LT(compressed_len, raw.size());

  // Threshold lands exactly on the compressed length: kept
  CompressResult at_threshold = compress(raw, LEVEL, ratio_for(raw.size(), compressed_len, 0.5));
  EXPECT_EQ(at_threshold.stored_as, StoredAs::Gzip);
  EXPECT_EQ(at_threshold.payload.size(), compressed_len);

  // Threshold one byte below the compressed length: raw
  CompressResult over_threshold = compress(raw, LEVEL, ratio_for(raw.size(), compressed_len, -0.5));
  EXPECT_EQ(over_threshold.stored_as, StoredAs::Raw);
  EXPECT_EQ(over_threshold.payload, raw);
}

TEST_F(CompressorTest, KeepsCompressedUsesFloor) {
  EXPECT_TRUE(keeps_compressed(100, 50, 0.5));
  EXPECT_FALSE(keeps_compressed(100, 51, 0.5));
  // floor(10 * 0.75) == 7
  EXPECT_TRUE(keeps_compressed(10, 7, 0.25));
  EXPECT_FALSE(keeps_compressed(10, 8, 0.25));
  // A zero ratio keeps output that is merely no larger
  EXPECT_TRUE(keeps_compressed(10, 10, 0.0));
  EXPECT_FALSE(keeps_compressed(10, 11, 0.0));
}

TEST_F(CompressorTest, GzipOutputIsDeterministic) {
  Bytes raw = compressible_bytes(4096);
  Bytes first = gzip_compress(raw, LEVEL);
  Bytes second = gzip_compress(raw, LEVEL);
  EXPECT_EQ(first, second);

  // gzip magic and a zero mtime field
  ASSERT_GE(first.size(), 10u);
  EXPECT_EQ(first[0], 0x1f);
  EXPECT_EQ(first[1], 0x8b);
  for (size_t i = 4; i < 8; ++i) {
    EXPECT_EQ(first[i], 0) << "mtime byte " << i;
  }
}

TEST_F(CompressorTest, InvalidLevelThrows) {
  EXPECT_THROW(gzip_compress(to_bytes("payload"), 42), EncodeError);
  EXPECT_THROW(compress(to_bytes("payload"), -7, 0.02), CompressError);
}

TEST_F(CompressorTest, DecompressRejectsGarbage) {
  EXPECT_THROW(decompress(to_bytes("definitely not gzip"), StoredAs::Gzip), DecodeError);
  EXPECT_THROW(decompress(Bytes{}, StoredAs::Gzip), DecodeError);
}

TEST_F(CompressorTest, DecompressRejectsTruncatedStream) {
  Bytes payload = gzip_compress(compressible_bytes(4096), LEVEL);
  payload.resize(payload.size() - 4);
  EXPECT_THROW(gzip_decompress(payload), DecodeError);

  payload.resize(payload.size() / 2);
  EXPECT_THROW(gzip_decompress(payload), DecodeError);
}

TEST_F(CompressorTest, DecompressRejectsTrailingData) {
  Bytes payload = gzip_compress(compressible_bytes(4096), LEVEL);
  payload.push_back(0x00);
  payload.push_back(0x42);
  EXPECT_THROW(gzip_decompress(payload), DecodeError);
}

TEST_F(CompressorTest, DecompressStopsAtSizeLimit) {
  Bytes raw(256 * 1024, 0x00);
  Bytes payload = gzip_compress(raw, LEVEL);

  EXPECT_EQ(gzip_decompress(payload, raw.size()), raw);
  EXPECT_THROW(gzip_decompress(payload, raw.size() - 1), SizeLimitError);
  EXPECT_THROW(decompress(payload, StoredAs::Gzip, 1000), DecodeError);

  try {
    gzip_decompress(payload, 1000);
    FAIL() << "Expected SizeLimitError";
  } catch (const SizeLimitError& e) {
    EXPECT_EQ(e.limit(), 1000u);
  }

  Bytes plain = to_bytes("raw payload");
  EXPECT_EQ(decompress(plain, StoredAs::Raw, plain.size()), plain);
  EXPECT_THROW(decompress(plain, StoredAs::Raw, plain.size() - 1), SizeLimitError);
}

TEST_F(CompressorTest, RawDecompressIsIdentity) {
  Bytes payload = to_bytes("not compressed at all");
  EXPECT_EQ(decompress(payload, StoredAs::Raw), payload);
}

TEST_F(CompressorTest, VariantNames) {
  EXPECT_STREQ(to_string(StoredAs::Raw), "raw");
  EXPECT_STREQ(to_string(StoredAs::Gzip), "gzip");
  EXPECT_STREQ(file_extension(StoredAs::Raw), "raw");
  EXPECT_STREQ(file_extension(StoredAs::Gzip), "gz");

  EXPECT_EQ(stored_as_from_string("raw"), StoredAs::Raw);
  EXPECT_EQ(stored_as_from_string("gzip"), StoredAs::Gzip);
  EXPECT_THROW(stored_as_from_string("gz"), DecodeError);
  EXPECT_THROW(stored_as_from_string("zstd"), DecodeError);
}

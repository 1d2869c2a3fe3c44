#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "chunker/hash/sha256.hpp"
#include "test_utils.hpp"

using namespace chunker::hash;

namespace {
const std::string EMPTY_DIGEST = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const std::string ABC_DIGEST = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const std::string TWO_BLOCK_DIGEST = "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1";
}

TEST(Sha256Test, KnownVectors) {
  EXPECT_EQ(sha256_hex(chunker::Bytes{}), EMPTY_DIGEST);
  EXPECT_EQ(sha256_hex(to_bytes("abc")), ABC_DIGEST);
  EXPECT_EQ(sha256_hex(to_bytes("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")),
            TWO_BLOCK_DIGEST);
}

TEST(Sha256Test, HexIsLowercaseAnd64Chars) {
  std::string hex = to_hex(sha256(to_bytes("abc")));
  EXPECT_EQ(hex.size(), DIGEST_SIZE * 2);
  EXPECT_TRUE(is_hex_digest(hex));
  EXPECT_EQ(hex.find_first_of("ABCDEF"), std::string::npos);
}

TEST(Sha256Test, StreamingMatchesOneShot) {
  chunker::Bytes data = random_bytes(10000, 7);
  const Digest expected = sha256(data);

  // Split the input at several uneven boundaries, including empty updates
  const std::vector<size_t> cuts = {0, 1, 63, 64, 65, 4096, 9999, 10000};
  for (size_t split : cuts) {
    Sha256 hasher;
    hasher.update(data.data(), split);
    hasher.update(nullptr, 0);
    hasher.update(data.data() + split, data.size() - split);
    EXPECT_EQ(hasher.finalize(), expected) << "Split at " << split;
  }

  Sha256 bytewise;
  for (uint8_t byte : data) {
    bytewise.update(&byte, 1);
  }
  EXPECT_EQ(bytewise.finalize(), expected);
}

TEST(Sha256Test, NoUpdatesEqualsEmptyDigest) {
  Sha256 hasher;
  EXPECT_EQ(to_hex(hasher.finalize()), EMPTY_DIGEST);
}

TEST(Sha256Test, UseAfterFinalizeThrows) {
  Sha256 hasher;
  hasher.update(to_bytes("abc"));
  hasher.finalize();
  EXPECT_TRUE(hasher.finalized());

  EXPECT_THROW(hasher.finalize(), HashError);
  EXPECT_THROW(hasher.update(to_bytes("more")), HashError);
}

TEST(Sha256Test, ResetStartsFreshComputation) {
  Sha256 hasher;
  hasher.update(to_bytes("discarded"));
  hasher.reset();
  EXPECT_FALSE(hasher.finalized());
  hasher.update(to_bytes("abc"));
  EXPECT_EQ(to_hex(hasher.finalize()), ABC_DIGEST);

  hasher.reset();
  EXPECT_EQ(to_hex(hasher.finalize()), EMPTY_DIGEST);
}

TEST(Sha256Test, MovedAccumulatorKeepsState) {
  Sha256 first;
  first.update(to_bytes("ab"));
  Sha256 second(std::move(first));
  second.update(to_bytes("c"));
  EXPECT_EQ(to_hex(second.finalize()), ABC_DIGEST);

  EXPECT_THROW(first.update(to_bytes("x")), HashError);
}

TEST(Sha256Test, IsHexDigest) {
  EXPECT_TRUE(is_hex_digest(ABC_DIGEST));
  EXPECT_FALSE(is_hex_digest(""));
  EXPECT_FALSE(is_hex_digest(ABC_DIGEST.substr(1)));
  EXPECT_FALSE(is_hex_digest(ABC_DIGEST + "0"));

  std::string upper = ABC_DIGEST;
  upper[0] = 'B';
  EXPECT_FALSE(is_hex_digest(upper));

  std::string non_hex = ABC_DIGEST;
  non_hex[10] = 'g';
  EXPECT_FALSE(is_hex_digest(non_hex));
}

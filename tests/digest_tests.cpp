#include "utilities/digest.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace nbdatatools;

namespace {
std::span<const std::byte> bytesOf(const std::string &s) {
  return std::as_bytes(std::span<const char>(s.data(), s.size()));
}
} // namespace

TEST(Digest, ReturnsExpectedDigest) {
  EXPECT_EQ(toHex(sha256(bytesOf("test"))),
            "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08");
  EXPECT_EQ(toHex(sha256(bytesOf(""))),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Digest, StreamingMatchesOneShot) {
  std::string text = "merkle verified incremental cache";
  Sha256Hasher hasher;
  hasher.ingest(bytesOf(text.substr(0, 10)));
  hasher.ingest(bytesOf(text.substr(10)));
  EXPECT_EQ(hasher.finalize(), sha256(bytesOf(text)));
  EXPECT_THROW(hasher.finalize(), std::logic_error);
}

TEST(Digest, PairIsOrderSensitive) {
  DigestArray a = sha256(bytesOf("a"));
  DigestArray b = sha256(bytesOf("b"));
  EXPECT_NE(sha256Pair(a, b), sha256Pair(b, a));

  Sha256Hasher hasher;
  hasher.ingest(reinterpret_cast<const std::byte *>(a.data()), a.size());
  hasher.ingest(reinterpret_cast<const std::byte *>(b.data()), b.size());
  EXPECT_EQ(sha256Pair(a, b), hasher.finalize());
}

TEST(Digest, ZeroDigest) {
  EXPECT_TRUE(isZeroDigest(DigestArray{}));
  EXPECT_FALSE(isZeroDigest(sha256(bytesOf("x"))));
}

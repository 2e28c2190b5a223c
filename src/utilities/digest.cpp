#include "utilities/digest.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace nbdatatools {

void ensureSodium() {
  static std::once_flag once;
  static int rc = 0;
  std::call_once(once, [] { rc = sodium_init(); });
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (rc < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

Sha256Hasher::Sha256Hasher() {
  ensureSodium();
  crypto_hash_sha256_init(&state_);
}

void Sha256Hasher::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error("Cannot ingest data after finalize() has been called.");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(
        &state_, reinterpret_cast<const unsigned char *>(data), size);
  }
}

void Sha256Hasher::ingest(std::span<const std::byte> data) {
  ingest(data.data(), data.size());
}

DigestArray Sha256Hasher::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }
  DigestArray digest{};
  crypto_hash_sha256_final(&state_, digest.data());
  finalized_ = true;
  return digest;
}

DigestArray sha256(std::span<const std::byte> data) {
  Sha256Hasher hasher;
  hasher.ingest(data);
  return hasher.finalize();
}

DigestArray sha256Pair(const DigestArray &left, const DigestArray &right) {
  Sha256Hasher hasher;
  hasher.ingest(reinterpret_cast<const std::byte *>(left.data()), left.size());
  hasher.ingest(reinterpret_cast<const std::byte *>(right.data()),
                right.size());
  return hasher.finalize();
}

std::string toHex(const DigestArray &digest) {
  char hex[DIGEST_SIZE * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), digest.data(), digest.size());
  return std::string(hex);
}

bool isZeroDigest(const DigestArray &digest) {
  return std::all_of(digest.begin(), digest.end(),
                     [](uint8_t b) { return b == 0; });
}

} // namespace nbdatatools

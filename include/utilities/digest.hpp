#ifndef NBDATATOOLS_DIGEST_HPP
#define NBDATATOOLS_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <sodium.h>
#include <span>
#include <string>

namespace nbdatatools {

/// Digest size for SHA-256 (32 bytes).
inline constexpr size_t DIGEST_SIZE = crypto_hash_sha256_BYTES;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Initialize libsodium once for the process.
 * @throw std::runtime_error If libsodium cannot be initialized.
 */
void ensureSodium();

/**
 * @brief Streaming SHA-256 over libsodium.
 *
 * Bytes are fed with ingest() and the digest is produced once by finalize().
 */
class Sha256Hasher {
public:
  Sha256Hasher();

  void ingest(const std::byte *data, size_t size);
  void ingest(std::span<const std::byte> data);

  /**
   * @brief Finish hashing and return the digest.
   * @throw std::logic_error If called more than once.
   */
  DigestArray finalize();

private:
  crypto_hash_sha256_state state_;
  bool finalized_ = false;
};

/// One-shot SHA-256 of a byte range.
DigestArray sha256(std::span<const std::byte> data);

/// SHA-256 of the concatenation left || right.
DigestArray sha256Pair(const DigestArray &left, const DigestArray &right);

/// Lowercase hex rendering of a digest.
std::string toHex(const DigestArray &digest);

bool isZeroDigest(const DigestArray &digest);

} // namespace nbdatatools

#endif // NBDATATOOLS_DIGEST_HPP

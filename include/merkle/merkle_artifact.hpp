#ifndef NBDATATOOLS_MERKLE_ARTIFACT_HPP
#define NBDATATOOLS_MERKLE_ARTIFACT_HPP

#include "merkle/merkle_shape.hpp"
#include "utilities/digest.hpp"

#include <array>
#include <boost/dynamic_bitset.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nbdatatools {

/// Per-leaf validity bits; byte i/8 holds leaf i at bit i%8 (LSB first).
using BitVector = boost::dynamic_bitset<uint8_t>;

inline constexpr const char *REFERENCE_SUFFIX = ".mref";
inline constexpr const char *STATE_SUFFIX = ".mrkl";

/**
 * @brief Fixed 45-byte big-endian trailer of .mref and .mrkl files.
 *
 * Layout: u64 chunkSize, u64 totalContentSize, u32 totalChunks,
 * u32 leafCount, u32 capLeaf, u32 nodeCount, u32 offset,
 * u32 internalNodeCount, u32 bitSetSize, u8 footerLength.
 */
struct MerkleFooter {
  static constexpr uint8_t FOOTER_LENGTH = 45;

  uint64_t chunkSize = 0;
  uint64_t totalContentSize = 0;
  uint32_t totalChunks = 0;
  uint32_t leafCount = 0;
  uint32_t capLeaf = 0;
  uint32_t nodeCount = 0;
  uint32_t offset = 0;
  uint32_t internalNodeCount = 0;
  uint32_t bitSetSize = 0;
  uint8_t footerLength = FOOTER_LENGTH;

  static MerkleFooter fromShape(const MerkleShape &shape);
  std::array<uint8_t, FOOTER_LENGTH> encode() const;
  /// @throw FormatError On short input or a bad footer length byte.
  static MerkleFooter decode(const uint8_t *data, size_t size);
  /// Rebuild the shape and check every derived field against it.
  /// @throw FormatError If the footer is inconsistent.
  MerkleShape toShape() const;

  bool operator==(const MerkleFooter &) const = default;
};

/// Decoded contents of a .mref or .mrkl file.
struct MerkleArtifact {
  MerkleShape shape;
  std::vector<DigestArray> hashes; ///< nodeCount entries, heap order
  BitVector validLeaves;           ///< leafCount bits
};

uint32_t bitSetSizeFor(const MerkleShape &shape);
/// Byte offset of the bitset section within an artifact file.
uint64_t bitSetOffsetFor(const MerkleShape &shape);
uint64_t artifactSizeFor(const MerkleShape &shape);

std::vector<uint8_t> bitsToBytes(const BitVector &bits);
BitVector bitsFromBytes(const uint8_t *data, size_t byteCount, size_t bitCount);

/**
 * @brief Read and validate an artifact.
 * @throw FormatError If the file is missing, short, or inconsistent.
 */
MerkleArtifact readArtifact(const std::string &path);

/**
 * @brief Write an artifact atomically (temporary file then rename).
 * @throw std::runtime_error On I/O failure.
 */
void writeArtifact(const std::string &path, const MerkleShape &shape,
                   const std::vector<DigestArray> &hashes,
                   const BitVector &validLeaves);

} // namespace nbdatatools

#endif // NBDATATOOLS_MERKLE_ARTIFACT_HPP

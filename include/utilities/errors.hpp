#ifndef NBDATATOOLS_ERRORS_HPP
#define NBDATATOOLS_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace nbdatatools {

/// A reference or state artifact is missing, truncated or corrupt.
class FormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Downloaded bytes for a leaf did not match the expected hash.
class IntegrityError : public std::runtime_error {
public:
  IntegrityError(uint32_t leafIndex, const std::string &message)
      : std::runtime_error(message), leafIndex_(leafIndex) {}

  uint32_t leafIndex() const noexcept { return leafIndex_; }

private:
  uint32_t leafIndex_;
};

/// Failure reported by a transport collaborator.
class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// A state was asked to become a reference before every leaf was verified.
class IncompleteStateError : public std::runtime_error {
public:
  IncompleteStateError(uint32_t validCount, uint32_t totalCount)
      : std::runtime_error("State is incomplete: " +
                           std::to_string(validCount) + "/" +
                           std::to_string(totalCount) + " chunks valid"),
        validCount_(validCount), totalCount_(totalCount) {}

  uint32_t validCount() const noexcept { return validCount_; }
  uint32_t totalCount() const noexcept { return totalCount_; }

private:
  uint32_t validCount_;
  uint32_t totalCount_;
};

} // namespace nbdatatools

#endif // NBDATATOOLS_ERRORS_HPP

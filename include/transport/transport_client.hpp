#ifndef NBDATATOOLS_TRANSPORT_CLIENT_HPP
#define NBDATATOOLS_TRANSPORT_CLIENT_HPP

#include <cstddef>
#include <cstdint>
#include <future>
#include <string>
#include <vector>

namespace nbdatatools {

struct FetchResult {
  std::vector<std::byte> data;
  uint64_t offset = 0;
  uint64_t length = 0;
};

/**
 * @brief Range-readable byte source.
 *
 * Failures surface as TransportError through the returned futures. The
 * client must outlive every future it hands out.
 */
class TransportClient {
public:
  virtual ~TransportClient() = default;

  virtual std::future<FetchResult> fetchRange(uint64_t offset,
                                              uint64_t length) = 0;
  virtual std::future<uint64_t> size() = 0;
  virtual bool supportsRangeRequests() = 0;
  /// URL or path this client reads from.
  virtual std::string source() const = 0;
  virtual void close() = 0;
};

} // namespace nbdatatools

#endif // NBDATATOOLS_TRANSPORT_CLIENT_HPP

#ifndef NBDATATOOLS_FILE_TRANSPORT_HPP
#define NBDATATOOLS_FILE_TRANSPORT_HPP

#include "transport/transport_client.hpp"

#include <mutex>

namespace nbdatatools {

/// Positional reads from a local file, named by path or file:// URL.
class FileTransport : public TransportClient {
public:
  /// @throw TransportError If the file cannot be opened.
  explicit FileTransport(const std::string &pathOrUrl);
  ~FileTransport() override;

  std::future<FetchResult> fetchRange(uint64_t offset, uint64_t length) override;
  std::future<uint64_t> size() override;
  bool supportsRangeRequests() override { return true; }
  std::string source() const override { return path_; }
  void close() override;

private:
  std::string path_;
  mutable std::mutex mutex_;
  int fd_ = -1;
};

} // namespace nbdatatools

#endif // NBDATATOOLS_FILE_TRANSPORT_HPP

#ifndef NBDATATOOLS_HTTP_TRANSPORT_HPP
#define NBDATATOOLS_HTTP_TRANSPORT_HPP

#include "transport/transport_client.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace nbdatatools {

struct ParsedUrl {
  std::string scheme; ///< "http" or "https"
  std::string host;
  std::string port;
  std::string target; ///< path and query, starting with '/'
};

/// @throw std::invalid_argument For anything but http(s)://host[:port]/path.
ParsedUrl parseHttpUrl(const std::string &url);

/**
 * @brief HTTP/1.1 range client over Boost.Asio, with TLS for https URLs.
 *
 * Each request uses its own connection. Ranged GETs send
 * "Range: bytes=a-b" and accept 206, or 200 with the full body, which is
 * then sliced. Size and range support come from a HEAD request made once.
 */
class HttpTransport : public TransportClient {
public:
  struct Response {
    int status = 0;
    std::map<std::string, std::string> headers; ///< lower-case names
    std::string body;
  };

  explicit HttpTransport(const std::string &url);

  std::future<FetchResult> fetchRange(uint64_t offset, uint64_t length) override;
  std::future<uint64_t> size() override;
  bool supportsRangeRequests() override;
  std::string source() const override { return url_; }
  void close() override { closed_ = true; }

  /// Synchronous request; throws TransportError on network failure.
  Response request(const std::string &method,
                   const std::optional<std::pair<uint64_t, uint64_t>> &range) const;

private:
  struct HeadInfo {
    uint64_t contentLength = 0;
    bool acceptRanges = false;
  };

  HeadInfo headInfo();
  FetchResult fetchBlocking(uint64_t offset, uint64_t length) const;

  std::string url_;
  ParsedUrl parsed_;
  std::atomic<bool> closed_{false};
  std::mutex headMutex_;
  std::optional<HeadInfo> headInfo_;
};

} // namespace nbdatatools

#endif // NBDATATOOLS_HTTP_TRANSPORT_HPP

#include "transport/http_transport.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <cctype>
#include <cstring>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace nbdatatools {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

std::string trim(const std::string &str) {
  const std::string whitespace = " \t\n\r";
  size_t start = str.find_first_not_of(whitespace);
  size_t end = str.find_last_not_of(whitespace);
  if (start == std::string::npos)
    return "";
  return str.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool isEof(const boost::system::error_code &ec) {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

template <typename Stream>
HttpTransport::Response exchange(Stream &stream, const std::string &requestText,
                                 bool expectBody) {
  asio::write(stream, asio::buffer(requestText));

  asio::streambuf buf;
  asio::read_until(stream, buf, "\r\n\r\n");
  std::istream is(&buf);

  HttpTransport::Response response;
  std::string statusLine;
  std::getline(is, statusLine);
  std::istringstream statusStream(statusLine);
  std::string protocol;
  statusStream >> protocol >> response.status;
  if (protocol.rfind("HTTP/", 0) != 0) {
    throw TransportError("Malformed HTTP status line: " + trim(statusLine));
  }

  std::string line;
  while (std::getline(is, line) && line != "\r") {
    size_t delimiterPos = line.find(':');
    if (delimiterPos != std::string::npos) {
      response.headers[toLower(trim(line.substr(0, delimiterPos)))] =
          trim(line.substr(delimiterPos + 1));
    }
  }
  if (!expectBody) {
    return response;
  }

  auto drain = [&buf](std::string &out) {
    out.append(asio::buffers_begin(buf.data()), asio::buffers_end(buf.data()));
    buf.consume(buf.size());
  };
  drain(response.body);
  boost::system::error_code ec;
  auto lengthHeader = response.headers.find("content-length");
  if (lengthHeader != response.headers.end()) {
    uint64_t expected = std::stoull(lengthHeader->second);
    if (response.body.size() < expected) {
      asio::read(stream, buf,
                 asio::transfer_exactly(expected - response.body.size()), ec);
      if (ec && !isEof(ec)) {
        throw boost::system::system_error(ec);
      }
      drain(response.body);
    }
  } else {
    asio::read(stream, buf, asio::transfer_all(), ec);
    if (ec && !isEof(ec)) {
      throw boost::system::system_error(ec);
    }
    drain(response.body);
  }
  return response;
}

std::string buildRequest(const ParsedUrl &url, const std::string &method,
                         const std::optional<std::pair<uint64_t, uint64_t>> &range) {
  std::ostringstream req;
  req << method << " " << url.target << " HTTP/1.1\r\n";
  req << "Host: " << url.host << "\r\n";
  req << "User-Agent: nbdatatools\r\n";
  req << "Accept: */*\r\n";
  if (range) {
    req << "Range: bytes=" << range->first << "-" << range->second << "\r\n";
  }
  req << "Connection: close\r\n\r\n";
  return req.str();
}

} // namespace

ParsedUrl parseHttpUrl(const std::string &url) {
  ParsedUrl parsed;
  auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos) {
    throw std::invalid_argument("URL has no scheme: " + url);
  }
  parsed.scheme = toLower(url.substr(0, schemeEnd));
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw std::invalid_argument("Unsupported URL scheme: " + parsed.scheme);
  }
  std::string rest = url.substr(schemeEnd + 3);
  size_t pathStart = rest.find('/');
  std::string authority =
      pathStart == std::string::npos ? rest : rest.substr(0, pathStart);
  parsed.target = pathStart == std::string::npos ? "/" : rest.substr(pathStart);
  size_t colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    parsed.host = authority.substr(0, colon);
    parsed.port = authority.substr(colon + 1);
  } else {
    parsed.host = authority;
    parsed.port = parsed.scheme == "https" ? "443" : "80";
  }
  if (parsed.host.empty()) {
    throw std::invalid_argument("URL has no host: " + url);
  }
  return parsed;
}

HttpTransport::HttpTransport(const std::string &url)
    : url_(url), parsed_(parseHttpUrl(url)) {}

HttpTransport::Response HttpTransport::request(
    const std::string &method,
    const std::optional<std::pair<uint64_t, uint64_t>> &range) const {
  if (closed_) {
    throw TransportError("Transport closed: " + url_);
  }
  const std::string text = buildRequest(parsed_, method, range);
  const bool expectBody = method != "HEAD";
  try {
    asio::io_context io;
    tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(parsed_.host, parsed_.port);
    if (parsed_.scheme == "https") {
      asio::ssl::context ctx(asio::ssl::context::tls_client);
      ctx.set_default_verify_paths();
      asio::ssl::stream<tcp::socket> stream(io, ctx);
      stream.set_verify_mode(asio::ssl::verify_peer);
      stream.set_verify_callback(asio::ssl::host_name_verification(parsed_.host));
      if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                    parsed_.host.c_str())) {
        throw TransportError("Failed to set TLS server name for " +
                             parsed_.host);
      }
      asio::connect(stream.lowest_layer(), endpoints);
      stream.handshake(asio::ssl::stream_base::client);
      return exchange(stream, text, expectBody);
    }
    tcp::socket socket(io);
    asio::connect(socket, endpoints);
    return exchange(socket, text, expectBody);
  } catch (const boost::system::system_error &e) {
    throw TransportError(method + " " + url_ + " failed: " + e.what());
  } catch (const std::logic_error &e) {
    throw TransportError(method + " " + url_ + " returned a bad header: " +
                         e.what());
  }
}

HttpTransport::HeadInfo HttpTransport::headInfo() {
  std::lock_guard<std::mutex> lock(headMutex_);
  if (headInfo_) {
    return *headInfo_;
  }
  Response head = request("HEAD", std::nullopt);
  if (head.status != 200) {
    throw TransportError("HEAD " + url_ + " returned status " +
                         std::to_string(head.status));
  }
  HeadInfo p;
  auto length = head.headers.find("content-length");
  if (length == head.headers.end()) {
    throw TransportError("HEAD " + url_ + " has no Content-Length");
  }
  p.contentLength = std::stoull(length->second);
  auto ranges = head.headers.find("accept-ranges");
  p.acceptRanges =
      ranges != head.headers.end() && toLower(ranges->second) == "bytes";
  headInfo_ = p;
  return p;
}

FetchResult HttpTransport::fetchBlocking(uint64_t offset,
                                         uint64_t length) const {
  FetchResult result;
  result.offset = offset;
  if (length == 0) {
    return result;
  }
  Response response =
      request("GET", std::make_pair(offset, offset + length - 1));
  std::string_view bytes(response.body);
  if (response.status == 200) {
    // Server ignored the Range header and sent the whole resource.
    if (bytes.size() < offset + length) {
      throw TransportError("GET " + url_ + " returned " +
                           std::to_string(bytes.size()) +
                           " bytes, range needs " +
                           std::to_string(offset + length));
    }
    bytes = bytes.substr(offset, length);
  } else if (response.status != 206) {
    throw TransportError("GET " + url_ + " returned status " +
                         std::to_string(response.status));
  }
  if (bytes.size() != length) {
    throw TransportError("GET " + url_ + " returned " +
                         std::to_string(bytes.size()) + " bytes, expected " +
                         std::to_string(length));
  }
  result.data.resize(length);
  std::memcpy(result.data.data(), bytes.data(), length);
  result.length = length;
  Logger::trace("Fetched %llu bytes at %llu from %s",
                static_cast<unsigned long long>(length),
                static_cast<unsigned long long>(offset), url_.c_str());
  return result;
}

std::future<FetchResult> HttpTransport::fetchRange(uint64_t offset,
                                                   uint64_t length) {
  return std::async(std::launch::async, [this, offset, length] {
    return fetchBlocking(offset, length);
  });
}

std::future<uint64_t> HttpTransport::size() {
  return std::async(std::launch::async,
                    [this] { return headInfo().contentLength; });
}

bool HttpTransport::supportsRangeRequests() {
  try {
    return headInfo().acceptRanges;
  } catch (const TransportError &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              std::string("HEAD request failed: ") +
                                  e.what());
    return false;
  }
}

} // namespace nbdatatools

#include "channel/merkle_file_channel.hpp"
#include "test_utils.hpp"
#include "transport/file_transport.hpp"
#include "transport/http_transport.hpp"
#include "transport/transport_registry.hpp"
#include "utilities/errors.hpp"

#include <atomic>
#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include <map>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace nbdatatools;
using testutil::makeData;
using testutil::TempDir;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

std::string asString(const std::vector<std::byte> &bytes) {
  return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
}

/// Minimal blocking HTTP/1.1 server on 127.0.0.1 serving fixed resources.
class TestHttpServer {
public:
  explicit TestHttpServer(bool honorRanges = true)
      : acceptor_(io_, tcp::endpoint(asio::ip::address_v4::loopback(), 0)),
        honorRanges_(honorRanges) {}

  ~TestHttpServer() { stop(); }

  void serve(const std::string &path, std::string body) {
    resources_[path] = std::move(body);
  }

  void start() {
    thread_ = std::thread([this] { run(); });
  }

  void stop() {
    if (!thread_.joinable())
      return;
    stopping_ = true;
    boost::system::error_code ec;
    tcp::socket wake(io_);
    wake.connect(acceptor_.local_endpoint(), ec);
    thread_.join();
  }

  std::string url(const std::string &path) const {
    return "http://127.0.0.1:" +
           std::to_string(acceptor_.local_endpoint().port()) + path;
  }

  int rangeRequests() const { return rangeRequests_; }

private:
  void run() {
    while (!stopping_) {
      tcp::socket socket(io_);
      boost::system::error_code ec;
      acceptor_.accept(socket, ec);
      if (ec || stopping_)
        break;
      try {
        handle(socket);
      } catch (const std::exception &e) {
        ADD_FAILURE() << "test server error: " << e.what();
      }
    }
  }

  void handle(tcp::socket &socket) {
    asio::streambuf buf;
    asio::read_until(socket, buf, "\r\n\r\n");
    std::istream is(&buf);
    std::string method, target, version;
    is >> method >> target >> version;
    std::string line;
    std::getline(is, line);
    std::optional<std::pair<uint64_t, uint64_t>> range;
    while (std::getline(is, line) && line != "\r") {
      if (line.rfind("Range: bytes=", 0) == 0) {
        std::string bounds = line.substr(13);
        size_t dash = bounds.find('-');
        range = std::make_pair(std::stoull(bounds.substr(0, dash)),
                               std::stoull(bounds.substr(dash + 1)));
      }
    }

    std::ostringstream out;
    auto it = resources_.find(target);
    if (it == resources_.end()) {
      out << "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n"
          << "Connection: close\r\n\r\n";
    } else if (method == "HEAD") {
      out << "HTTP/1.1 200 OK\r\nContent-Length: " << it->second.size()
          << "\r\n";
      if (honorRanges_)
        out << "Accept-Ranges: bytes\r\n";
      out << "Connection: close\r\n\r\n";
    } else if (range && honorRanges_) {
      ++rangeRequests_;
      std::string part =
          it->second.substr(range->first, range->second - range->first + 1);
      out << "HTTP/1.1 206 Partial Content\r\nContent-Range: bytes "
          << range->first << "-" << range->second << "/" << it->second.size()
          << "\r\nContent-Length: " << part.size()
          << "\r\nConnection: close\r\n\r\n"
          << part;
    } else {
      out << "HTTP/1.1 200 OK\r\nContent-Length: " << it->second.size()
          << "\r\nConnection: close\r\n\r\n"
          << it->second;
    }
    asio::write(socket, asio::buffer(out.str()));
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
  }

  asio::io_context io_;
  tcp::acceptor acceptor_;
  bool honorRanges_;
  std::map<std::string, std::string> resources_;
  std::thread thread_;
  std::atomic<bool> stopping_{false};
  std::atomic<int> rangeRequests_{0};
};

} // namespace

TEST(HttpUrl, ParsesComponents) {
  ParsedUrl u = parseHttpUrl("http://example.com/a/b?x=1");
  EXPECT_EQ(u.scheme, "http");
  EXPECT_EQ(u.host, "example.com");
  EXPECT_EQ(u.port, "80");
  EXPECT_EQ(u.target, "/a/b?x=1");

  ParsedUrl s = parseHttpUrl("HTTPS://data.example.org:8443");
  EXPECT_EQ(s.scheme, "https");
  EXPECT_EQ(s.port, "8443");
  EXPECT_EQ(s.target, "/");
  EXPECT_EQ(parseHttpUrl("https://h/x").port, "443");
}

TEST(HttpUrl, RejectsUnsupportedUrls) {
  EXPECT_THROW(parseHttpUrl("ftp://example.com/x"), std::invalid_argument);
  EXPECT_THROW(parseHttpUrl("example.com/x"), std::invalid_argument);
  EXPECT_THROW(parseHttpUrl("http:///x"), std::invalid_argument);
}

TEST(HttpTransport, RangedFetch) {
  auto data = asString(makeData(50000));
  TestHttpServer server;
  server.serve("/data.bin", data);
  server.start();

  HttpTransport transport(server.url("/data.bin"));
  EXPECT_EQ(transport.size().get(), data.size());
  EXPECT_TRUE(transport.supportsRangeRequests());
  FetchResult r = transport.fetchRange(1000, 4096).get();
  EXPECT_EQ(r.offset, 1000u);
  EXPECT_EQ(r.length, 4096u);
  EXPECT_EQ(asString(r.data), data.substr(1000, 4096));
  EXPECT_EQ(server.rangeRequests(), 1);
  EXPECT_EQ(transport.source(), server.url("/data.bin"));
}

TEST(HttpTransport, FullResponseIsSliced) {
  auto data = asString(makeData(8000, 9));
  TestHttpServer server(false);
  server.serve("/data.bin", data);
  server.start();

  HttpTransport transport(server.url("/data.bin"));
  EXPECT_FALSE(transport.supportsRangeRequests());
  FetchResult r = transport.fetchRange(7000, 1000).get();
  EXPECT_EQ(asString(r.data), data.substr(7000, 1000));
  EXPECT_THROW(transport.fetchRange(7500, 1000).get(), TransportError);
}

TEST(HttpTransport, MissingResourceFails) {
  TestHttpServer server;
  server.start();
  HttpTransport transport(server.url("/nothing"));
  EXPECT_THROW(transport.fetchRange(0, 10).get(), TransportError);
  EXPECT_THROW(transport.size().get(), TransportError);
  EXPECT_FALSE(transport.supportsRangeRequests());
}

TEST(HttpTransport, ClosedTransportFails) {
  TestHttpServer server;
  server.serve("/data.bin", "abcdef");
  server.start();
  HttpTransport transport(server.url("/data.bin"));
  transport.close();
  EXPECT_THROW(transport.fetchRange(0, 3).get(), TransportError);
}

TEST(HttpTransport, ConnectionRefusedIsTransportError) {
  std::string url;
  {
    asio::io_context io;
    tcp::acceptor scratch(io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    url = "http://127.0.0.1:" + std::to_string(scratch.local_endpoint().port()) +
          "/x";
  }
  HttpTransport transport(url);
  EXPECT_THROW(transport.fetchRange(0, 10).get(), TransportError);
}

TEST(HttpTransport, ChannelOverHttp) {
  TempDir dir;
  auto bytes = makeData(100 * 1024, 5);
  TestHttpServer server;
  server.serve("/data.bin", asString(bytes));
  std::string refPath = dir.file("data.bin.mref");
  MerkleRef::fromData(bytes, 8 * 1024).save(refPath);
  server.serve("/data.bin.mref", asString(testutil::readFile(refPath)));
  server.start();

  auto channel = MerkleFileChannel::open(
      dir.file("cache/data.bin"), dir.file("cache/data.bin.mrkl"),
      server.url("/data.bin"), TransportRegistry::withDefaults());
  std::vector<std::byte> buf(20000);
  ASSERT_EQ(channel->read(buf, 30000).get(), buf.size());
  EXPECT_TRUE(std::equal(buf.begin(), buf.end(), bytes.begin() + 30000));
  EXPECT_EQ(channel->validChunkCount(), 4u);
}

TEST(FileTransport, ReadsRanges) {
  TempDir dir;
  auto data = makeData(4096);
  std::string path = dir.file("data.bin");
  testutil::writeFile(path, data);

  FileTransport transport("file://" + path);
  EXPECT_EQ(transport.source(), path);
  EXPECT_TRUE(transport.supportsRangeRequests());
  EXPECT_EQ(transport.size().get(), 4096u);
  FetchResult r = transport.fetchRange(100, 200).get();
  EXPECT_TRUE(std::equal(r.data.begin(), r.data.end(), data.begin() + 100));
  EXPECT_EQ(r.length, 200u);

  EXPECT_THROW(transport.fetchRange(4000, 200).get(), TransportError);
  transport.close();
  EXPECT_THROW(transport.fetchRange(0, 10).get(), TransportError);
}

TEST(FileTransport, MissingFileThrows) {
  TempDir dir;
  EXPECT_THROW(FileTransport transport(dir.file("absent.bin")), TransportError);
}

TEST(TransportRegistry, ResolvesSchemes) {
  TransportRegistry registry = TransportRegistry::withDefaults();
  EXPECT_EQ(registry.schemes(),
            (std::vector<std::string>{"file", "http", "https"}));
  EXPECT_EQ(TransportRegistry::schemeOf("/tmp/x"), "file");
  EXPECT_EQ(TransportRegistry::schemeOf("HTTPS://h/x"), "https");
  EXPECT_TRUE(registry.supports("http://h/x"));
  EXPECT_FALSE(registry.supports("s3://bucket/key"));
  EXPECT_THROW(registry.create("s3://bucket/key"), std::invalid_argument);
  EXPECT_NE(std::dynamic_pointer_cast<HttpTransport>(registry.create("http://h/x")),
            nullptr);
}

TEST(TransportRegistry, CustomSchemes) {
  TransportRegistry registry;
  auto memory = std::make_shared<testutil::CountingTransport>(makeData(10));
  registry.registerScheme("mem", [memory](const std::string &) { return memory; });
  EXPECT_EQ(registry.create("mem://anything"), memory);
  EXPECT_FALSE(registry.supports("/local/path"));
}

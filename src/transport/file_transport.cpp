#include "transport/file_transport.hpp"
#include "utilities/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace nbdatatools {

namespace {

template <typename T> std::future<T> failed(const std::string &message) {
  std::promise<T> p;
  p.set_exception(std::make_exception_ptr(TransportError(message)));
  return p.get_future();
}

} // namespace

FileTransport::FileTransport(const std::string &pathOrUrl) : path_(pathOrUrl) {
  const std::string prefix = "file://";
  if (path_.rfind(prefix, 0) == 0) {
    path_ = path_.substr(prefix.size());
  }
  fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    throw TransportError("Cannot open " + path_ + ": " + std::strerror(errno));
  }
}

FileTransport::~FileTransport() { close(); }

std::future<FetchResult> FileTransport::fetchRange(uint64_t offset,
                                                   uint64_t length) {
  int fd;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    fd = fd_;
  }
  if (fd < 0) {
    return failed<FetchResult>("Transport closed: " + path_);
  }
  FetchResult result;
  result.offset = offset;
  result.data.resize(length);
  size_t done = 0;
  while (done < length) {
    ssize_t n = ::pread(fd, result.data.data() + done, length - done,
                        static_cast<off_t>(offset + done));
    if (n < 0 && errno == EINTR)
      continue;
    if (n < 0) {
      return failed<FetchResult>("Read failed on " + path_ + ": " +
                                 std::strerror(errno));
    }
    if (n == 0)
      break;
    done += static_cast<size_t>(n);
  }
  if (done != length) {
    return failed<FetchResult>("Short read on " + path_ + ": wanted " +
                               std::to_string(length) + " bytes at " +
                               std::to_string(offset) + ", got " +
                               std::to_string(done));
  }
  result.length = done;
  std::promise<FetchResult> p;
  p.set_value(std::move(result));
  return p.get_future();
}

std::future<uint64_t> FileTransport::size() {
  std::lock_guard<std::mutex> lock(mutex_);
  struct stat st {};
  if (fd_ < 0 || ::fstat(fd_, &st) != 0) {
    return failed<uint64_t>("Cannot stat " + path_);
  }
  std::promise<uint64_t> p;
  p.set_value(static_cast<uint64_t>(st.st_size));
  return p.get_future();
}

void FileTransport::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

} // namespace nbdatatools

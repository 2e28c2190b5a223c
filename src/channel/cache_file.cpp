#include "channel/cache_file.hpp"
#include "utilities/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace nbdatatools {

namespace {

std::string errnoMessage(const std::string &what, const std::string &path) {
  return what + " " + path + ": " + std::strerror(errno);
}

} // namespace

CacheFile::CacheFile(const std::string &path, uint64_t size)
    : path_(path), size_(size) {
  std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::filesystem::create_directories(p.parent_path());
  }
  fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    throw std::runtime_error(errnoMessage("Cannot open cache file", path));
  }

  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    std::string msg = errnoMessage("Cannot stat cache file", path);
    ::close(fd_);
    fd_ = -1;
    throw std::runtime_error(msg);
  }
  if (static_cast<uint64_t>(st.st_size) < size && size > 0) {
    int rc = ::posix_fallocate(fd_, 0, static_cast<off_t>(size));
    if (rc != 0) {
      Logger::getInstance().log(LogLevel::DEBUG,
                                "posix_fallocate unavailable for " + path +
                                    ", falling back to ftruncate");
      if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        std::string msg = errnoMessage("Cannot size cache file", path);
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error(msg);
      }
    }
  }
}

CacheFile::~CacheFile() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

void CacheFile::readAt(uint64_t offset, std::span<std::byte> buffer) const {
  if (fd_ < 0) {
    throw std::runtime_error("Cache file is closed: " + path_);
  }
  size_t done = 0;
  while (done < buffer.size()) {
    ssize_t n = ::pread(fd_, buffer.data() + done, buffer.size() - done,
                        static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error(errnoMessage("Read failed on", path_));
    }
    if (n == 0) {
      throw std::runtime_error("Unexpected end of cache file " + path_);
    }
    done += static_cast<size_t>(n);
  }
}

void CacheFile::writeAt(uint64_t offset, std::span<const std::byte> data) {
  if (fd_ < 0) {
    throw std::runtime_error("Cache file is closed: " + path_);
  }
  size_t done = 0;
  while (done < data.size()) {
    ssize_t n = ::pwrite(fd_, data.data() + done, data.size() - done,
                         static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error(errnoMessage("Write failed on", path_));
    }
    done += static_cast<size_t>(n);
  }
}

void CacheFile::sync(bool metadata) {
  if (fd_ < 0) {
    return;
  }
  int rc = metadata ? ::fsync(fd_) : ::fdatasync(fd_);
  if (rc != 0) {
    throw std::runtime_error(errnoMessage("sync failed for", path_));
  }
}

void CacheFile::close() {
  if (fd_ < 0) {
    return;
  }
  int rc = ::fsync(fd_);
  int savedErrno = errno;
  ::close(fd_);
  fd_ = -1;
  if (rc != 0) {
    errno = savedErrno;
    throw std::runtime_error(errnoMessage("fsync failed for", path_));
  }
}

} // namespace nbdatatools

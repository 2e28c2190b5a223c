#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace nbdatatools {

/**
 * @brief Local random-access cache file pre-sized to the content length.
 *
 * Owns a POSIX descriptor; reads and writes are positional and may run
 * concurrently on disjoint ranges.
 */
class CacheFile {
public:
  /// Open or create path and make sure it is at least size bytes long.
  CacheFile(const std::string &path, uint64_t size);
  CacheFile(const CacheFile &) = delete;
  CacheFile &operator=(const CacheFile &) = delete;
  ~CacheFile();

  /// Read exactly buffer.size() bytes at offset.
  void readAt(uint64_t offset, std::span<std::byte> buffer) const;
  void writeAt(uint64_t offset, std::span<const std::byte> data);
  /// fdatasync, or fsync when metadata is true.
  void sync(bool metadata = false);
  void close();

  bool isOpen() const { return fd_ >= 0; }
  uint64_t size() const { return size_; }
  const std::string &path() const { return path_; }

private:
  std::string path_;
  uint64_t size_;
  int fd_ = -1;
};

} // namespace nbdatatools

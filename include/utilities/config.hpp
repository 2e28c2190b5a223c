#ifndef NBDATATOOLS_CONFIG_HPP
#define NBDATATOOLS_CONFIG_HPP

#include "utilities/logger.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace nbdatatools {

/**
 * @brief Runtime options for the cache and the command line tool.
 *
 * Values come from a YAML file, then environment overrides are applied.
 */
struct CacheConfig {
  std::string cacheDir;
  uint64_t chunkSize = 0; ///< 0 selects the automatic chunk size
  std::string scheduler = "default";
  size_t maxConcurrentDownloads = 8;
  uint64_t regionSize = 1024 * 1024;
  LogLevel logLevel = LogLevel::INFO;
};

/// Load from $NBDATATOOLS_CONFIG, or nbdatatools.yaml when unset.
CacheConfig loadCacheConfig();

/**
 * @brief Load from an explicit YAML path, then apply environment overrides.
 *
 * A missing file yields defaults. A malformed file or a bad value yields
 * defaults for the affected keys and a WARN log entry.
 */
CacheConfig loadCacheConfig(const std::string &path);

} // namespace nbdatatools

#endif // NBDATATOOLS_CONFIG_HPP

#include "utilities/config.hpp"
#include "utilities/cache_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace nbdatatools {

namespace {

template <typename T>
void readKey(const YAML::Node &node, const char *key, T &out) {
  if (!node[key])
    return;
  try {
    out = node[key].as<T>();
  } catch (const YAML::Exception &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              std::string("Ignoring config key '") + key +
                                  "': " + e.what());
  }
}

void applyEnvOverrides(CacheConfig &cfg) {
  if (const char *env = std::getenv("NBDATATOOLS_CACHE_DIR"))
    cfg.cacheDir = env;
  if (const char *env = std::getenv("NBDATATOOLS_SCHEDULER"))
    cfg.scheduler = env;
  if (const char *env = std::getenv("NBDATATOOLS_MAX_DOWNLOADS")) {
    try {
      int value = std::stoi(env);
      if (value > 0)
        cfg.maxConcurrentDownloads = static_cast<size_t>(value);
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::WARN,
                                std::string("Invalid NBDATATOOLS_MAX_DOWNLOADS '") +
                                    env + "': " + e.what());
    }
  }
}

} // namespace

CacheConfig loadCacheConfig() {
  const char *cfg = std::getenv("NBDATATOOLS_CONFIG");
  if (!cfg)
    cfg = "nbdatatools.yaml";
  return loadCacheConfig(cfg);
}

CacheConfig loadCacheConfig(const std::string &path) {
  CacheConfig cfg;
  cfg.cacheDir = getCacheDir();

  if (std::filesystem::exists(path)) {
    try {
      YAML::Node node = YAML::LoadFile(path);
      readKey(node, "cache_dir", cfg.cacheDir);
      readKey(node, "chunk_size", cfg.chunkSize);
      readKey(node, "scheduler", cfg.scheduler);
      readKey(node, "max_concurrent_downloads", cfg.maxConcurrentDownloads);
      readKey(node, "region_size", cfg.regionSize);
      if (node["log_level"]) {
        std::string level;
        readKey(node, "log_level", level);
        cfg.logLevel = Logger::levelFromString(level);
      }
    } catch (const YAML::Exception &e) {
      Logger::getInstance().log(LogLevel::WARN, "Failed to parse config " +
                                                    path + ": " + e.what());
      cfg = CacheConfig{};
      cfg.cacheDir = getCacheDir();
    }
  }

  applyEnvOverrides(cfg);
  if (cfg.maxConcurrentDownloads == 0)
    cfg.maxConcurrentDownloads = 1;
  return cfg;
}

} // namespace nbdatatools

#include "test_utils.hpp"
#include "utilities/cache_dir.hpp"
#include "utilities/config.hpp"

#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>

using namespace nbdatatools;
using testutil::TempDir;

class CacheConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clearEnv(); }
  void TearDown() override { clearEnv(); }

  static void clearEnv() {
    ::unsetenv("NBDATATOOLS_CACHE_DIR");
    ::unsetenv("NBDATATOOLS_SCHEDULER");
    ::unsetenv("NBDATATOOLS_MAX_DOWNLOADS");
    ::unsetenv("NBDATATOOLS_CONFIG");
  }

  std::string writeConfig(const std::string &yaml) {
    std::string path = dir_.file("nbdatatools.yaml");
    std::ofstream(path) << yaml;
    return path;
  }

  TempDir dir_;
};

TEST_F(CacheConfigTest, MissingFileGivesDefaults) {
  CacheConfig cfg = loadCacheConfig(dir_.file("absent.yaml"));
  EXPECT_EQ(cfg.cacheDir, getCacheDir());
  EXPECT_EQ(cfg.chunkSize, 0u);
  EXPECT_EQ(cfg.scheduler, "default");
  EXPECT_EQ(cfg.maxConcurrentDownloads, 8u);
  EXPECT_EQ(cfg.regionSize, 1024u * 1024);
  EXPECT_EQ(cfg.logLevel, LogLevel::INFO);
}

TEST_F(CacheConfigTest, ReadsYamlKeys) {
  std::string path = writeConfig("cache_dir: /srv/cache\n"
                                 "chunk_size: 65536\n"
                                 "scheduler: aggressive\n"
                                 "max_concurrent_downloads: 3\n"
                                 "region_size: 4096\n"
                                 "log_level: debug\n");
  CacheConfig cfg = loadCacheConfig(path);
  EXPECT_EQ(cfg.cacheDir, "/srv/cache");
  EXPECT_EQ(cfg.chunkSize, 65536u);
  EXPECT_EQ(cfg.scheduler, "aggressive");
  EXPECT_EQ(cfg.maxConcurrentDownloads, 3u);
  EXPECT_EQ(cfg.regionSize, 4096u);
  EXPECT_EQ(cfg.logLevel, LogLevel::DEBUG);
}

TEST_F(CacheConfigTest, BadValueKeepsDefault) {
  std::string path = writeConfig("chunk_size: lots\nscheduler: conservative\n");
  CacheConfig cfg = loadCacheConfig(path);
  EXPECT_EQ(cfg.chunkSize, 0u);
  EXPECT_EQ(cfg.scheduler, "conservative");
}

TEST_F(CacheConfigTest, MalformedFileGivesDefaults) {
  std::string path = writeConfig("scheduler: [unterminated\n");
  CacheConfig cfg = loadCacheConfig(path);
  EXPECT_EQ(cfg.scheduler, "default");
}

TEST_F(CacheConfigTest, EnvironmentOverridesFile) {
  std::string path = writeConfig("scheduler: aggressive\n"
                                 "max_concurrent_downloads: 3\n");
  ::setenv("NBDATATOOLS_SCHEDULER", "adaptive", 1);
  ::setenv("NBDATATOOLS_MAX_DOWNLOADS", "12", 1);
  ::setenv("NBDATATOOLS_CACHE_DIR", "/tmp/override", 1);
  CacheConfig cfg = loadCacheConfig(path);
  EXPECT_EQ(cfg.scheduler, "adaptive");
  EXPECT_EQ(cfg.maxConcurrentDownloads, 12u);
  EXPECT_EQ(cfg.cacheDir, "/tmp/override");
}

TEST_F(CacheConfigTest, InvalidDownloadLimitIsIgnored) {
  ::setenv("NBDATATOOLS_MAX_DOWNLOADS", "many", 1);
  CacheConfig cfg = loadCacheConfig(dir_.file("absent.yaml"));
  EXPECT_EQ(cfg.maxConcurrentDownloads, 8u);

  std::string path = writeConfig("max_concurrent_downloads: 0\n");
  ::unsetenv("NBDATATOOLS_MAX_DOWNLOADS");
  EXPECT_EQ(loadCacheConfig(path).maxConcurrentDownloads, 1u);
}

TEST_F(CacheConfigTest, ConfigPathFromEnvironment) {
  std::string path = writeConfig("scheduler: conservative\n");
  ::setenv("NBDATATOOLS_CONFIG", path.c_str(), 1);
  EXPECT_EQ(loadCacheConfig().scheduler, "conservative");
}

TEST(CacheDir, MapsUrlsUnderCacheDir) {
  std::string saved = getCacheDir();
  setCacheDir("/var/cache/nbdt");
  EXPECT_EQ(logsDir(), "/var/cache/nbdt/logs");
  EXPECT_EQ(cachePathFor("https://example.com:8443/data/base.fvec?sig=1"),
            "/var/cache/nbdt/example.com_8443/data/base.fvec");
  EXPECT_EQ(cachePathFor("http://host/../../etc/passwd"),
            "/var/cache/nbdt/host/etc/passwd");
  EXPECT_EQ(statePathFor("http://host/a.bin"), "/var/cache/nbdt/host/a.bin.mrkl");
  setCacheDir(saved);
}

#include "channel/merkle_file_channel.hpp"
#include "merkle/merkle_artifact.hpp"
#include "merkle/merkle_ref.hpp"
#include "transport/transport_registry.hpp"
#include "utilities/cache_dir.hpp"
#include "utilities/config.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

using namespace nbdatatools;

static void usage() {
  std::cout << "Usage: nbdt merkle create <file> [chunkSize]\n"
               "       nbdt merkle summary <file.mref|file.mrkl>\n"
               "       nbdt merkle verify <file> <file.mref>\n"
               "       nbdt merkle diff <a.mref> <b.mref>\n"
               "       nbdt fetch <url> [offset length]\n";
}

static uint64_t parseSize(const std::string &text) {
  size_t used = 0;
  uint64_t value = std::stoull(text, &used);
  if (used != text.size()) {
    throw std::invalid_argument("Not a number: " + text);
  }
  return value;
}

static int create_command(const std::string &file, uint64_t chunkSize) {
  auto [future, progress] = MerkleRef::buildAsync(file, chunkSize);
  while (future.wait_for(std::chrono::milliseconds(200)) !=
         std::future_status::ready) {
    std::cout << "\rHashing " << progress->processedChunks.load() << "/"
              << progress->totalChunks.load() << " chunks" << std::flush;
  }
  MerkleRef ref = future.get();
  std::string out = file + REFERENCE_SUFFIX;
  ref.save(out);
  std::cout << "\rWrote " << out << " (" << ref.shape().leafCount()
            << " chunks, root " << toHex(ref.rootHash()) << ")" << std::endl;
  return 0;
}

static int summary_command(const std::string &path) {
  MerkleArtifact artifact = readArtifact(path);
  const MerkleShape &shape = artifact.shape;
  std::cout << "File:          " << path << "\n"
            << "Content size:  " << shape.totalContentSize() << "\n"
            << "Chunk size:    " << shape.chunkSize() << "\n"
            << "Chunks:        " << shape.leafCount() << "\n"
            << "Leaf slots:    " << shape.capLeaf() << "\n"
            << "Nodes:         " << shape.nodeCount() << "\n"
            << "Valid chunks:  " << artifact.validLeaves.count() << "/"
            << shape.leafCount() << "\n"
            << "Root hash:     " << toHex(artifact.hashes.front()) << std::endl;
  return 0;
}

static int verify_command(const std::string &file, const std::string &mref) {
  MerkleRef expected = MerkleRef::load(mref);
  MerkleRef actual = MerkleRef::fromFile(file, expected.shape().chunkSize());
  auto mismatches = expected.findMismatchedChunks(actual);
  if (mismatches.empty()) {
    std::cout << "Verification succeeded" << std::endl;
    return 0;
  }
  std::cout << "Verification FAILED: " << mismatches.size()
            << " chunk(s) differ" << std::endl;
  for (const auto &m : mismatches) {
    std::cout << "  chunk " << m.leafIndex << " offset " << m.startOffset
              << " length " << m.length << std::endl;
  }
  return 1;
}

static int diff_command(const std::string &a, const std::string &b) {
  MerkleRef left = MerkleRef::load(a);
  MerkleRef right = MerkleRef::load(b);
  if (left.shape() != right.shape()) {
    std::cout << "Shapes differ: " << left.shape().totalContentSize() << "/"
              << left.shape().chunkSize() << " vs "
              << right.shape().totalContentSize() << "/"
              << right.shape().chunkSize() << std::endl;
  }
  auto mismatches = left.findMismatchedChunks(right);
  for (const auto &m : mismatches) {
    std::cout << m.leafIndex << "\t" << m.startOffset << "\t" << m.length
              << std::endl;
  }
  std::cout << mismatches.size() << " mismatched chunk(s)" << std::endl;
  return mismatches.empty() ? 0 : 1;
}

static int fetch_command(const CacheConfig &cfg, const std::string &url,
                         uint64_t offset, uint64_t length, bool whole) {
  ChannelOptions options;
  options.maxConcurrentDownloads = cfg.maxConcurrentDownloads;
  options.regionSize = cfg.regionSize;
  options.schedulerName = cfg.scheduler;

  TransportRegistry registry = TransportRegistry::withDefaults();
  auto channel = MerkleFileChannel::open(cachePathFor(url), statePathFor(url),
                                         url, registry, options);
  if (whole) {
    offset = 0;
    length = channel->size();
  }
  PrebufferHandle handle = channel->prebuffer(offset, length);
  while (!handle.isDone()) {
    std::cout << "\r" << std::fixed << std::setprecision(1) << handle.percent()
              << "% (" << handle.currentChunks() << "/" << handle.totalChunks()
              << " chunks, " << channel->inFlightDownloadCount()
              << " downloading)" << std::flush;
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
  }
  handle.get();
  channel->force(true);
  std::cout << "\rCached " << handle.totalChunks() << " chunks of " << url
            << " in " << cachePathFor(url) << std::endl;
  channel->close();
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 3) {
    usage();
    return 1;
  }

  CacheConfig cfg = loadCacheConfig();
  setCacheDir(cfg.cacheDir);
  try {
    std::filesystem::create_directories(logsDir());
    Logger::init(logsDir() + "/nbdt.log", cfg.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 1;
  }

  std::string group = argv[1];
  std::string cmd = argv[2];
  try {
    if (group == "merkle" && cmd == "create" && argc >= 4) {
      return create_command(argv[3], argc >= 5 ? parseSize(argv[4])
                                               : cfg.chunkSize);
    }
    if (group == "merkle" && cmd == "summary" && argc >= 4) {
      return summary_command(argv[3]);
    }
    if (group == "merkle" && cmd == "verify" && argc >= 5) {
      return verify_command(argv[3], argv[4]);
    }
    if (group == "merkle" && cmd == "diff" && argc >= 5) {
      return diff_command(argv[3], argv[4]);
    }
    if (group == "fetch") {
      if (argc >= 5) {
        return fetch_command(cfg, cmd, parseSize(argv[3]), parseSize(argv[4]),
                             false);
      }
      return fetch_command(cfg, cmd, 0, 0, true);
    }
  } catch (const FormatError &e) {
    std::cerr << "Invalid merkle file: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  usage();
  return 1;
}

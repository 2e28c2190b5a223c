#include "utilities/cache_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace nbdatatools {

static std::string cacheDir = [] {
  const char *env = std::getenv("NBDATATOOLS_CACHE_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  const char *home = std::getenv("HOME");
  if (home && home[0] != '\0')
    return std::string(home) + "/.cache/nbdatatools";
  return std::string("var/nbdatatools");
}();

void setCacheDir(const std::string &dir) { cacheDir = dir; }

const std::string &getCacheDir() { return cacheDir; }

std::string logsDir() { return getCacheDir() + "/logs"; }

std::string cachePathFor(const std::string &url) {
  namespace fs = std::filesystem;
  std::string rest = url;
  auto schemeEnd = rest.find("://");
  if (schemeEnd != std::string::npos)
    rest = rest.substr(schemeEnd + 3);
  auto query = rest.find_first_of("?#");
  if (query != std::string::npos)
    rest = rest.substr(0, query);
  for (char &c : rest) {
    if (c == ':')
      c = '_';
  }
  fs::path clean;
  for (const auto &part : fs::path(rest).relative_path()) {
    if (part.empty() || part == ".." || part == ".")
      continue;
    clean /= part;
  }
  return (fs::path(getCacheDir()) / clean).string();
}

std::string statePathFor(const std::string &url) {
  return cachePathFor(url) + ".mrkl";
}

} // namespace nbdatatools

#pragma once

#include <string>

namespace nbdatatools {

void setCacheDir(const std::string &dir);
const std::string &getCacheDir();

std::string logsDir();

/// Local cache file for a remote URL, laid out as <cacheDir>/<host>/<path>.
std::string cachePathFor(const std::string &url);
/// State artifact path paired with cachePathFor(url).
std::string statePathFor(const std::string &url);

} // namespace nbdatatools

#include "transport/transport_registry.hpp"
#include "transport/file_transport.hpp"
#include "transport/http_transport.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nbdatatools {

TransportRegistry TransportRegistry::withDefaults() {
  TransportRegistry registry;
  registry.registerScheme("file", [](const std::string &url) {
    return std::make_shared<FileTransport>(url);
  });
  auto http = [](const std::string &url) {
    return std::make_shared<HttpTransport>(url);
  };
  registry.registerScheme("http", http);
  registry.registerScheme("https", http);
  return registry;
}

std::string TransportRegistry::schemeOf(const std::string &url) {
  auto pos = url.find("://");
  if (pos == std::string::npos) {
    return "file";
  }
  std::string scheme = url.substr(0, pos);
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return scheme;
}

void TransportRegistry::registerScheme(const std::string &scheme,
                                       Factory factory) {
  factories_[scheme] = std::move(factory);
}

bool TransportRegistry::supports(const std::string &url) const {
  return factories_.count(schemeOf(url)) > 0;
}

std::vector<std::string> TransportRegistry::schemes() const {
  std::vector<std::string> names;
  for (const auto &kv : factories_) {
    names.push_back(kv.first);
  }
  return names;
}

std::shared_ptr<TransportClient>
TransportRegistry::create(const std::string &url) const {
  auto it = factories_.find(schemeOf(url));
  if (it == factories_.end()) {
    throw std::invalid_argument("No transport for scheme '" + schemeOf(url) +
                                "' in " + url);
  }
  return it->second(url);
}

} // namespace nbdatatools

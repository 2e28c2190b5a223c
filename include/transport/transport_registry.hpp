#ifndef NBDATATOOLS_TRANSPORT_REGISTRY_HPP
#define NBDATATOOLS_TRANSPORT_REGISTRY_HPP

#include "transport/transport_client.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nbdatatools {

/**
 * @brief Explicit URL scheme to transport factory map.
 *
 * A URL without "scheme://" is treated as a local path ("file").
 */
class TransportRegistry {
public:
  using Factory =
      std::function<std::shared_ptr<TransportClient>(const std::string &url)>;

  /// Registry with "file", "http" and "https" registered.
  static TransportRegistry withDefaults();

  void registerScheme(const std::string &scheme, Factory factory);
  bool supports(const std::string &url) const;
  std::vector<std::string> schemes() const;

  /// @throw std::invalid_argument If no factory handles the URL's scheme.
  std::shared_ptr<TransportClient> create(const std::string &url) const;

  static std::string schemeOf(const std::string &url);

private:
  std::map<std::string, Factory> factories_;
};

} // namespace nbdatatools

#endif // NBDATATOOLS_TRANSPORT_REGISTRY_HPP

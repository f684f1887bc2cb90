#include "halyard/dispatcher-config.hpp"

#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "halyard/compression-config.hpp"

namespace halyard {

void DispatcherConfig::validate() const {
  if (defaultContentType.empty()) {
    throw std::invalid_argument("Default content type cannot be empty");
  }
  compression.validate();
}

DispatcherConfig& DispatcherConfig::withDefaultContentType(std::string_view contentType) {
  defaultContentType = contentType;
  return *this;
}

DispatcherConfig& DispatcherConfig::withServerHeader(std::string_view serverHeaderValue) {
  serverHeader = serverHeaderValue;
  return *this;
}

DispatcherConfig& DispatcherConfig::withCaseSensitiveUrls(bool on) {
  caseSensitiveUrls = on;
  return *this;
}

DispatcherConfig& DispatcherConfig::withPrefer405over404(bool on) {
  prefer405over404 = on;
  return *this;
}

DispatcherConfig& DispatcherConfig::withDynamicGzip(bool on) {
  dynamicGzip = on;
  return *this;
}

DispatcherConfig& DispatcherConfig::withAutogeneratedEtags(bool on) {
  autogeneratedEtags = on;
  return *this;
}

DispatcherConfig& DispatcherConfig::withCompression(CompressionConfig compressionConfig) {
  compression = std::move(compressionConfig);
  return *this;
}

DispatcherConfig& DispatcherConfig::withMaxRequestCacheBodySize(std::size_t bytes) {
  maxRequestCacheBodySize = bytes;
  return *this;
}

DispatcherConfig& DispatcherConfig::withDebugLogging(bool on) {
  debugLogging = on;
  return *this;
}

}  // namespace halyard

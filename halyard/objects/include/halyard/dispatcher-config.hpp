#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "halyard/compression-config.hpp"
#include "halyard/http-constants.hpp"

namespace halyard {

struct DispatcherConfig {
  // ===========================
  // Response defaults
  // ===========================
  // Content type set on every response before any handler runs. Handlers may override it.
  std::string defaultContentType{http::ContentTypeTextPlain};

  // Value of the 'Server' header set on every response. Handlers may override it per response.
  std::string serverHeader{"halyard"};

  // ===========================
  // Routing policy
  // ===========================
  // When false (default), request paths are lowercased before matching and registered path
  // patterns must be lowercase.
  bool caseSensitiveUrls{false};

  // When a path has handlers for other methods but not for the request method, reply
  // 405 Method Not Allowed instead of 404 Not Found. Default: false.
  bool prefer405over404{false};

  // ===========================
  // Output negotiation
  // ===========================
  // Compress results with gzip when they are large enough and the client accepts it.
  bool dynamicGzip{true};

  // Compute an ETag (checksum of the result) for GET responses that do not set one explicitly,
  // and reply 304 Not Modified when it matches If-None-Match.
  bool autogeneratedEtags{false};

  CompressionConfig compression;

  // ===========================
  // Request body caching
  // ===========================
  // Request bodies up to this size are kept in memory so that they can be read multiple times.
  std::size_t maxRequestCacheBodySize{4096};

  // ===========================
  // Diagnostics
  // ===========================
  // Log a detailed description of each request and response at info level when no request
  // logger is installed.
  bool debugLogging{false};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  DispatcherConfig& withDefaultContentType(std::string_view contentType);

  DispatcherConfig& withServerHeader(std::string_view serverHeaderValue);

  DispatcherConfig& withCaseSensitiveUrls(bool on = true);

  DispatcherConfig& withPrefer405over404(bool on = true);

  DispatcherConfig& withDynamicGzip(bool on = true);

  DispatcherConfig& withAutogeneratedEtags(bool on = true);

  DispatcherConfig& withCompression(CompressionConfig compressionConfig);

  DispatcherConfig& withMaxRequestCacheBodySize(std::size_t bytes);

  DispatcherConfig& withDebugLogging(bool on = true);
};

}  // namespace halyard

#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "halyard/server-request.hpp"
#include "halyard/server-response.hpp"

namespace halyard {

// Fallback resolver for unmatched GET / HEAD requests.
// Returns true when it fully handled the request (status, headers and body written, response committed).
using StaticResolver = std::function<bool(const ServerRequest&, ServerResponse&)>;

// Serves files located below one or several root directories, tried in order.
// Directories are served through their 'index.html'. Paths with '..' segments are rejected.
class StaticFileResolver {
 public:
  StaticFileResolver() noexcept = default;

  // Throws std::invalid_argument if one of the roots is not an existing directory.
  explicit StaticFileResolver(std::vector<std::filesystem::path> roots);

  // Adds a root directory, tried after the previous ones.
  // Throws std::invalid_argument if 'root' is not an existing directory.
  StaticFileResolver& addRoot(std::filesystem::path root);

  // Serves the file targeted by 'request', if any. Only GET and HEAD are served, HEAD without body.
  // Returns false when no root holds the file.
  // Throws std::runtime_error if writing to 'response' fails.
  bool operator()(const ServerRequest& request, ServerResponse& response) const;

  [[nodiscard]] const std::vector<std::filesystem::path>& roots() const noexcept { return _roots; }

 private:
  [[nodiscard]] static bool ResolveTarget(const std::filesystem::path& root, std::string_view requestPath,
                                          std::filesystem::path& resolvedPath);

  std::vector<std::filesystem::path> _roots;
};

}  // namespace halyard

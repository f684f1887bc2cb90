#include "halyard/static-file-resolver.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ios>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "halyard/http-constants.hpp"
#include "halyard/http-status-code.hpp"
#include "halyard/log.hpp"
#include "halyard/mime-mappings.hpp"
#include "halyard/server-request.hpp"
#include "halyard/server-response.hpp"
#include "halyard/string-equal-ignore-case.hpp"

namespace halyard {

namespace {
constexpr std::string_view kDefaultIndex = "index.html";
constexpr std::size_t kReadChunkSize = 64UL * 1024UL;
}  // namespace

StaticFileResolver::StaticFileResolver(std::vector<std::filesystem::path> roots) {
  _roots.reserve(roots.size());
  for (auto& root : roots) {
    addRoot(std::move(root));
  }
}

StaticFileResolver& StaticFileResolver::addRoot(std::filesystem::path root) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    throw std::invalid_argument("Static files root '" + root.string() + "' is not a directory");
  }
  _roots.push_back(std::move(root));
  return *this;
}

bool StaticFileResolver::ResolveTarget(const std::filesystem::path& root, std::string_view requestPath,
                                       std::filesystem::path& resolvedPath) {
  if (requestPath.starts_with('/')) {
    requestPath.remove_prefix(1);
  }
  std::filesystem::path relative;
  while (!requestPath.empty()) {
    const auto slashPos = requestPath.find('/');
    const auto segment = requestPath.substr(0, slashPos);
    if (!segment.empty() && segment != ".") {
      if (segment == "..") {
        return false;
      }
      relative /= std::filesystem::path(segment);
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    requestPath.remove_prefix(slashPos + 1);
  }

  resolvedPath = root / relative;
  std::error_code ec;
  const auto status = std::filesystem::status(resolvedPath, ec);
  if (ec) {
    return false;
  }
  if (std::filesystem::is_directory(status)) {
    resolvedPath /= kDefaultIndex;
    return std::filesystem::is_regular_file(resolvedPath, ec);
  }
  return std::filesystem::is_regular_file(status);
}

bool StaticFileResolver::operator()(const ServerRequest& request, ServerResponse& response) const {
  const bool isHead = CaseInsensitiveEqual(request.method(), http::HEAD);
  if (!isHead && !CaseInsensitiveEqual(request.method(), http::GET)) {
    return false;
  }
  for (const auto& root : _roots) {
    std::filesystem::path targetPath;
    if (!ResolveTarget(root, request.path(), targetPath)) {
      continue;
    }
    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(targetPath, ec);
    if (ec) {
      log::warn("Unable to get size of '{}': {}", targetPath.string(), ec.message());
      continue;
    }
    std::ifstream file(targetPath, std::ios::binary);
    if (!file.is_open()) {
      log::warn("Unable to open static file '{}'", targetPath.string());
      continue;
    }

    log::debug("Serving static file '{}' ({} bytes)", targetPath.string(), fileSize);
    response.setStatus(http::StatusCodeOK);
    response.setHeader(http::ContentType, DetermineMIMEType(targetPath.filename().string()));
    response.setHeader(http::ContentLength, std::to_string(fileSize));
    if (!isHead) {
      std::string buf(kReadChunkSize, '\0');
      while (file) {
        file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto nbRead = static_cast<std::size_t>(file.gcount());
        if (nbRead == 0) {
          break;
        }
        response.write(std::string_view(buf.data(), nbRead));
      }
    }
    response.commit();
    return true;
  }
  return false;
}

}  // namespace halyard

#include "halyard/result-stream.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ios>
#include <memory>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace halyard {

ResultStream ResultStream::FromString(std::string data) {
  return ResultStream(std::make_unique<std::istringstream>(std::move(data)));
}

ResultStream ResultStream::FromFile(const std::filesystem::path& filePath) {
  auto file = std::make_unique<std::ifstream>(filePath, std::ios::binary);
  if (!file->is_open()) {
    throw std::runtime_error("Unable to open file " + filePath.string());
  }
  return ResultStream(std::move(file));
}

std::size_t ResultStream::available() const {
  if (!_stream) {
    return 0;
  }
  const auto curPos = _stream->tellg();
  if (curPos == std::istream::pos_type(-1)) {
    _stream->clear();
    return 0;
  }
  _stream->seekg(0, std::ios::end);
  const auto endPos = _stream->tellg();
  _stream->seekg(curPos);
  if (endPos == std::istream::pos_type(-1) || endPos < curPos) {
    _stream->clear();
    return 0;
  }
  return static_cast<std::size_t>(endPos - curPos);
}

std::size_t ResultStream::read(std::span<char> buf) {
  if (!_stream || buf.empty()) {
    return 0;
  }
  _stream->read(buf.data(), static_cast<std::streamsize>(buf.size()));
  const auto nbRead = static_cast<std::size_t>(_stream->gcount());
  if (_stream->eof() && !_stream->bad()) {
    // keep the stream seekable after hitting the end
    _stream->clear();
  }
  return nbRead;
}

std::string ResultStream::readAll() {
  std::string ret;
  std::array<char, 8192> buf;
  for (std::size_t nbRead = read(buf); nbRead != 0; nbRead = read(buf)) {
    ret.append(buf.data(), nbRead);
  }
  return ret;
}

void ResultStream::reset() {
  if (_stream) {
    _stream->clear();
    _stream->seekg(0, std::ios::beg);
  }
}

}  // namespace halyard

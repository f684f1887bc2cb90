#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>

namespace halyard {

// Readable, rewindable byte source holding a handler result.
// It owns its underlying std::istream. A closed (or default constructed) stream has no bytes available.
// The underlying stream must be seekable for available() and reset() to be meaningful.
class ResultStream {
 public:
  ResultStream() noexcept = default;

  explicit ResultStream(std::unique_ptr<std::istream> stream) noexcept : _stream(std::move(stream)) {}

  // Creates a stream over an in-memory copy of 'data'.
  static ResultStream FromString(std::string data);

  // Opens 'filePath' in binary mode. Throws std::runtime_error if it cannot be opened.
  static ResultStream FromFile(const std::filesystem::path& filePath);

  // Number of bytes remaining between the current read position and the end of the stream.
  [[nodiscard]] std::size_t available() const;

  // Reads up to buf.size() bytes into 'buf' and returns the number of bytes read.
  // 0 means end of stream.
  std::size_t read(std::span<char> buf);

  // Reads all remaining bytes.
  std::string readAll();

  // Moves the read position back to the beginning of the stream.
  void reset();

  // Releases the underlying stream. Idempotent.
  void close() noexcept { _stream.reset(); }

  [[nodiscard]] bool isOpen() const noexcept { return static_cast<bool>(_stream); }

 private:
  std::unique_ptr<std::istream> _stream;
};

}  // namespace halyard

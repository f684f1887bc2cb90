#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace halyard {

using PathParams = std::map<std::string, std::string, std::less<>>;

// Compiled path pattern of a handler binding.
//
// Grammar (segments separated by '/'):
//  - literal segment, matched exactly: /users
//  - parameter segment, capturing one path segment: /users/{id}
//  - wildcard segment '*': in the middle of a pattern it matches one or more segments, as the
//    last segment it matches the remainder of the path, possibly empty. Matched text is recorded as a splat.
// The pattern "*" alone matches every path.
// A single trailing slash is not significant, neither in the pattern nor in the matched path.
class PathPattern {
 public:
  struct Match {
    PathParams params;
    std::vector<std::string> splats;
  };

  // Compiles 'pattern'. When 'caseSensitive' is false, literal segments are lowercased so that they match
  // lowercased request paths (parameter names keep their case).
  // Throws std::invalid_argument if the pattern is empty, does not start with '/' (except "*"),
  // contains unbalanced or misplaced braces, an empty parameter name or a duplicated parameter name.
  explicit PathPattern(std::string_view pattern, bool caseSensitive = true);

  // Matches 'path' against this pattern, returning captured parameters and splats on success.
  [[nodiscard]] std::optional<Match> match(std::string_view path) const;

  [[nodiscard]] bool matches(std::string_view path) const { return match(path).has_value(); }

  // The pattern as registered.
  [[nodiscard]] std::string_view str() const noexcept { return _pattern; }

 private:
  enum class SegmentType : std::uint8_t { Literal, Param, Wildcard };

  struct Segment {
    SegmentType type;
    std::string value;
  };

  struct Capture {
    std::size_t segmentIdx;
    std::size_t beg;
    std::size_t end;
  };

  bool matchFrom(std::size_t segIdx, std::span<const std::string_view> pathSegments, std::size_t pathIdx,
                 std::vector<Capture>& captures) const;

  std::string _pattern;
  std::vector<Segment> _segments;
};

}  // namespace halyard

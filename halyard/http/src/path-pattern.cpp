#include "halyard/path-pattern.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "halyard/string-equal-ignore-case.hpp"

namespace halyard {

namespace {

// Splits 'path' on '/', ignoring one leading and one trailing slash.
// "/" and "" have no segments, "/a//b/" has segments "a", "" and "b".
std::vector<std::string_view> SplitSegments(std::string_view path) {
  std::vector<std::string_view> segments;
  if (path.starts_with('/')) {
    path.remove_prefix(1);
  }
  if (path.ends_with('/')) {
    path.remove_suffix(1);
  }
  if (path.empty()) {
    return segments;
  }
  for (std::size_t pos = 0;;) {
    const std::size_t sepPos = path.find('/', pos);
    if (sepPos == std::string_view::npos) {
      segments.push_back(path.substr(pos));
      break;
    }
    segments.push_back(path.substr(pos, sepPos - pos));
    pos = sepPos + 1;
  }
  return segments;
}

bool HasBrace(std::string_view str) { return str.find_first_of("{}") != std::string_view::npos; }

}  // namespace

PathPattern::PathPattern(std::string_view pattern, bool caseSensitive) : _pattern(pattern) {
  if (pattern.empty()) {
    throw std::invalid_argument("Path pattern cannot be empty");
  }
  if (pattern == "*") {
    _segments.push_back(Segment{SegmentType::Wildcard, {}});
    return;
  }
  if (!pattern.starts_with('/')) {
    throw std::invalid_argument("Path pattern '" + _pattern + "' should start with '/'");
  }
  for (std::string_view segment : SplitSegments(pattern)) {
    if (segment == "*") {
      _segments.push_back(Segment{SegmentType::Wildcard, {}});
    } else if (segment.size() >= 2 && segment.front() == '{' && segment.back() == '}') {
      const std::string_view name = segment.substr(1, segment.size() - 2);
      if (name.empty() || HasBrace(name)) {
        throw std::invalid_argument("Invalid parameter segment '" + std::string(segment) + "' in path pattern '" +
                                    _pattern + "'");
      }
      const bool duplicated = std::ranges::any_of(_segments, [name](const Segment& existing) {
        return existing.type == SegmentType::Param && existing.value == name;
      });
      if (duplicated) {
        throw std::invalid_argument("Duplicated parameter '" + std::string(name) + "' in path pattern '" + _pattern +
                                    "'");
      }
      _segments.push_back(Segment{SegmentType::Param, std::string(name)});
    } else if (HasBrace(segment)) {
      throw std::invalid_argument("Unbalanced brace in path pattern '" + _pattern + "'");
    } else {
      _segments.push_back(
          Segment{SegmentType::Literal, caseSensitive ? std::string(segment) : ToLowerCopy(segment)});
    }
  }
}

std::optional<PathPattern::Match> PathPattern::match(std::string_view path) const {
  const std::vector<std::string_view> pathSegments = SplitSegments(path);
  std::vector<Capture> captures;
  if (!matchFrom(0, pathSegments, 0, captures)) {
    return std::nullopt;
  }
  Match ret;
  for (const Capture& capture : captures) {
    const Segment& segment = _segments[capture.segmentIdx];
    if (segment.type == SegmentType::Param) {
      ret.params.emplace(segment.value, pathSegments[capture.beg]);
    } else {
      std::string splat;
      for (std::size_t pathIdx = capture.beg; pathIdx < capture.end; ++pathIdx) {
        if (pathIdx != capture.beg) {
          splat.push_back('/');
        }
        splat.append(pathSegments[pathIdx]);
      }
      ret.splats.push_back(std::move(splat));
    }
  }
  return ret;
}

bool PathPattern::matchFrom(std::size_t segIdx, std::span<const std::string_view> pathSegments, std::size_t pathIdx,
                            std::vector<Capture>& captures) const {
  if (segIdx == _segments.size()) {
    return pathIdx == pathSegments.size();
  }
  const Segment& segment = _segments[segIdx];
  switch (segment.type) {
    case SegmentType::Literal:
      return pathIdx < pathSegments.size() && pathSegments[pathIdx] == segment.value &&
             matchFrom(segIdx + 1, pathSegments, pathIdx + 1, captures);
    case SegmentType::Param:
      if (pathIdx == pathSegments.size() || pathSegments[pathIdx].empty()) {
        return false;
      }
      captures.push_back(Capture{segIdx, pathIdx, pathIdx + 1});
      if (matchFrom(segIdx + 1, pathSegments, pathIdx + 1, captures)) {
        return true;
      }
      captures.pop_back();
      return false;
    case SegmentType::Wildcard:
      if (segIdx + 1 == _segments.size()) {
        captures.push_back(Capture{segIdx, pathIdx, pathSegments.size()});
        return true;
      }
      // shortest match first
      for (std::size_t endIdx = pathIdx + 1; endIdx <= pathSegments.size(); ++endIdx) {
        captures.push_back(Capture{segIdx, pathIdx, endIdx});
        if (matchFrom(segIdx + 1, pathSegments, endIdx, captures)) {
          return true;
        }
        captures.pop_back();
      }
      return false;
    default:
      return false;
  }
}

}  // namespace halyard

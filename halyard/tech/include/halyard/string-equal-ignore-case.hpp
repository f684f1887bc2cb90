#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "halyard/toupperlower.hpp"

namespace halyard {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  if (value.size() < prefix.size()) {
    return false;
  }

  const char* pVal = value.data();
  const char* pPre = prefix.data();
  const char* end = pPre + prefix.size();

  for (; pPre != end; ++pVal, ++pPre) {
    if (tolower(*pVal) != tolower(*pPre)) {
      return false;
    }
  }
  return true;
}

// Tells whether 'needle' appears anywhere in 'haystack', ignoring ASCII case.
// An empty needle is always found.
constexpr bool ContainsCaseInsensitive(std::string_view haystack, std::string_view needle) {
  if (needle.size() > haystack.size()) {
    return false;
  }
  const std::size_t lastStart = haystack.size() - needle.size();
  for (std::size_t pos = 0; pos <= lastStart; ++pos) {
    if (StartsWithCaseInsensitive(haystack.substr(pos), needle)) {
      return true;
    }
  }
  return false;
}

// Returns a lowercase copy of 'str' (ASCII only).
inline std::string ToLowerCopy(std::string_view str) {
  std::string ret(str);
  for (char& ch : ret) {
    ch = tolower(ch);
  }
  return ret;
}

struct CaseInsensitiveHashFunc {
  using is_transparent = void;

  constexpr std::size_t operator()(std::string_view str) const noexcept {
    std::size_t hash = 0;
    const char* beg = str.data();
    const char* end = beg + str.size();
    for (; beg != end; ++beg) {
      hash ^= static_cast<std::size_t>(tolower(*beg)) + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) + (hash << 6) +
              (hash >> 2);
    }
    return hash;
  }
};

struct CaseInsensitiveEqualFunc {
  using is_transparent = void;

  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace halyard

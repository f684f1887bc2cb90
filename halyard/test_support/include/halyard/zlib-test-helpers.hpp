#pragma once

#include <string>
#include <string_view>

namespace halyard::test {

// Inflates a complete gzip member. Throws std::runtime_error if the data is not valid gzip.
std::string GzipDecompress(std::string_view compressed);

}  // namespace halyard::test

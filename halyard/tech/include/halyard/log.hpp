#pragma once

// Logging goes through spdlog. Format strings use fmt syntax.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace halyard {

namespace log = spdlog;

}  // namespace halyard

#pragma once

// Logging goes through spdlog. Callers write log::debug(...), log::warn(...) inside namespace routetrie.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace routetrie {

namespace log = spdlog;

}  // namespace routetrie

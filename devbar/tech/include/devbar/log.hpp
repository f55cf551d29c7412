#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace devbar {

// All devbar components log through this alias (log::debug, log::error, ...) so that the hosting application
// controls sinks and verbosity with the usual spdlog API.
namespace log = spdlog;

}  // namespace devbar

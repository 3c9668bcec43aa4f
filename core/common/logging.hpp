#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace grafdiff {

/// Library-wide logger, registered under the name "grafdiff".
/// Created on first use with a stderr sink.
std::shared_ptr<spdlog::logger> logger();

/// Replace the library logger (e.g. to route output into a host application).
/// Passing nullptr restores the default logger.
void setLogger(std::shared_ptr<spdlog::logger> replacement);

} // namespace grafdiff

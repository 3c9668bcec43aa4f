#include "common/logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace grafdiff {

namespace {

constexpr const char* kLoggerName = "grafdiff";

std::mutex& loggerMutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<spdlog::logger>& loggerSlot() {
    static std::shared_ptr<spdlog::logger> slot;
    return slot;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(loggerMutex());
    auto& slot = loggerSlot();
    if (!slot) {
        slot = spdlog::get(kLoggerName);
        if (!slot) {
            slot = spdlog::stderr_color_mt(kLoggerName);
        }
    }
    return slot;
}

void setLogger(std::shared_ptr<spdlog::logger> replacement) {
    std::lock_guard<std::mutex> lock(loggerMutex());
    loggerSlot() = std::move(replacement);
}

} // namespace grafdiff

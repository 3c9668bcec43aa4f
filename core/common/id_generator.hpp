#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace grafdiff {

/// Issues process-unique ids of the form "<prefix>_<n>".
/// One counter is shared by all prefixes; safe to call from several threads.
class IdGenerator {
public:
    std::string next(const std::string& prefix) {
        return prefix + "_" + std::to_string(++counter_);
    }

    uint64_t issued() const { return counter_.load(); }

private:
    std::atomic<uint64_t> counter_{0};
};

} // namespace grafdiff

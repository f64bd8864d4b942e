#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "core/errors/forge_errors.hpp"

namespace forge::core::config {

// Deadline for the monitoring phase. An empty limit means unlimited.
struct TimeoutSpec {
    std::optional<std::chrono::seconds> limit;

    bool unlimited() const { return !limit.has_value(); }
    std::string describe() const;

    static TimeoutSpec unbounded() { return TimeoutSpec{}; }
    static TimeoutSpec seconds(std::int64_t value) {
        return TimeoutSpec{std::chrono::seconds(value)};
    }
};

// Accepts "<n>", "<n>s", "<n>m", "<n>h" and the sentinels "unlimited",
// "none" and "0". Whitespace and letter case are ignored.
errors::Result<TimeoutSpec> parse_timeout(const std::string& text);

}  // namespace forge::core::config

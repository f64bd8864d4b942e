#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace forge::core::config {

    inline constexpr const char* kExecutionIdPrefix = "exec-";

    // "exec-<YYYYmmdd_HHMMSS>-<6 hex digits>". IDs created within the same
    // second differ in the random suffix; lexical order follows creation time.
    inline std::string generate_execution_id(
        const std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) {
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&seconds, &local);

        static thread_local std::mt19937 engine{std::random_device{}()};
        std::uniform_int_distribution<unsigned int> suffix(0, 0xFFFFFF);

        std::ostringstream id;
        id << kExecutionIdPrefix << std::put_time(&local, "%Y%m%d_%H%M%S") << "-"
           << std::hex << std::setw(6) << std::setfill('0') << suffix(engine);
        return id.str();
    }

} // namespace forge::core::config

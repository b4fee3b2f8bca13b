#include "util/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace kbindexer::time {

std::string to_iso8601(Timestamp value) {
    using clock = std::chrono::system_clock;
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(value);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(value - seconds).count();
    auto whole = seconds;
    if (ms < 0) {
        // pre-epoch values round toward negative infinity
        whole -= std::chrono::seconds(1);
        ms += 1000;
    }

    const std::time_t time_t_value = clock::to_time_t(whole);
    std::tm tm_buffer{};
#if defined(_WIN32)
    gmtime_s(&tm_buffer, &time_t_value);
#else
    gmtime_r(&time_t_value, &tm_buffer);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buffer, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

std::string current_time_iso8601() { return to_iso8601(std::chrono::system_clock::now()); }

}  // namespace kbindexer::time

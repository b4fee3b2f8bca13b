#pragma once

#include <chrono>
#include <string>

namespace kbindexer::time {

using Timestamp = std::chrono::system_clock::time_point;

// Returns the current UTC time formatted as ISO-8601 with millisecond precision.
std::string current_time_iso8601();

// Formats an arbitrary point in time the same way as current_time_iso8601().
std::string to_iso8601(Timestamp value);

}  // namespace kbindexer::time

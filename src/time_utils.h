#pragma once

#include <string>
#include <chrono>

namespace runbox {

// ISO-8601 UTC with millisecond precision, e.g. "2024-05-01T12:00:00.000Z"
std::string format_iso8601(std::chrono::system_clock::time_point tp);

} // namespace runbox

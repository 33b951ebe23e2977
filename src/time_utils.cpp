#include "time_utils.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace runbox {

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
    }

    std::time_t seconds = std::chrono::system_clock::to_time_t(tp - ms);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return out.str();
}

} // namespace runbox

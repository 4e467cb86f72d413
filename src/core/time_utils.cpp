#include <ktree/core/time_utils.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ktree {

std::string formatIso8601(TimePoint tp) {
    auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm tm_utc;
#ifdef _WIN32
    gmtime_s(&tm_utc, &time_t_tp);
#else
    gmtime_r(&time_t_tp, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string isoTimestampNow() {
    return formatIso8601(std::chrono::system_clock::now());
}

std::int64_t epochMillisNow() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace ktree

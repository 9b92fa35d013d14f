#include "utils/time_utils.h"

#include <cstdio>
#include <ctime>

namespace vesta {
namespace utils {

std::string epochMillisToIso8601(int64_t millis) {
    int64_t secs = millis / 1000;
    int64_t ms = millis % 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

std::string toIso8601(std::chrono::system_clock::time_point tp) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    return epochMillisToIso8601(static_cast<int64_t>(millis));
}

std::string nowIso8601() {
    return toIso8601(std::chrono::system_clock::now());
}

} // namespace utils
} // namespace vesta

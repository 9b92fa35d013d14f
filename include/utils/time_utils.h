#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace vesta {
namespace utils {

// Canonical timestamp form for persisted documents: "2024-05-01T12:30:00.123Z"
std::string toIso8601(std::chrono::system_clock::time_point tp);
std::string nowIso8601();

// Milliseconds since the Unix epoch -> ISO-8601 UTC
std::string epochMillisToIso8601(int64_t millis);

} // namespace utils
} // namespace vesta

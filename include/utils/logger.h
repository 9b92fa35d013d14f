#pragma once

// Windows compatibility - undef macros that conflict with Logger::Level
#ifdef ERROR
#undef ERROR
#endif

#include <string>
#include <memory>

namespace spdlog { class logger; }

namespace vesta {
namespace utils {

class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };
    
    // Console sink always; file sink only when log_file is non-empty
    static void init(const std::string& log_file = "vesta.log", Level level = Level::INFO);
    static void shutdown();
    static bool isInitialized();
    static std::shared_ptr<spdlog::logger> get();
    // Runtime controls
    static void setLevel(Level level);
    static void setPattern(const std::string& pattern);
    // Helper to convert from string to Level; returns INFO on unknown
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);
    
    template<typename FormatString, typename... Args>
    static void trace(FormatString&& fmt, Args&&... args);
    
    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args);
    
    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args);
    
    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args);
    
    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args);
    
    template<typename FormatString, typename... Args>
    static void critical(FormatString&& fmt, Args&&... args);
    
private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace vesta

// Include implementation
#include "utils/logger_impl.h"

// Logging macros
#define VESTA_TRACE(...) ::vesta::utils::Logger::trace(__VA_ARGS__)
#define VESTA_DEBUG(...) ::vesta::utils::Logger::debug(__VA_ARGS__)
#define VESTA_INFO(...) ::vesta::utils::Logger::info(__VA_ARGS__)
#define VESTA_WARN(...) ::vesta::utils::Logger::warn(__VA_ARGS__)
#define VESTA_ERROR(...) ::vesta::utils::Logger::error(__VA_ARGS__)
#define VESTA_CRITICAL(...) ::vesta::utils::Logger::critical(__VA_ARGS__)

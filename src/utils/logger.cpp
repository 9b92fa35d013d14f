#include "utils/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cctype>
#include <memory>
#include <iostream>
#include <vector>

// Windows defines ERROR as a macro; undef it
#ifdef ERROR
#undef ERROR
#endif

namespace vesta {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {

spdlog::level::level_enum toSpdlogLevel(Logger::Level level) {
    switch (level) {
        case Logger::Level::TRACE: return spdlog::level::trace;
        case Logger::Level::DEBUG: return spdlog::level::debug;
        case Logger::Level::INFO: return spdlog::level::info;
        case Logger::Level::WARN: return spdlog::level::warn;
        case Logger::Level::ERROR: return spdlog::level::err;
        case Logger::Level::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace

void Logger::init(const std::string& log_file, Level level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
        }

        // Re-init replaces the previous logger
        if (logger_) {
            logger_->flush();
        }
        logger_ = std::make_shared<spdlog::logger>("vesta", sinks.begin(), sinks.end());
        logger_->set_level(toSpdlogLevel(level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");

        spdlog::set_default_logger(logger_);

        logger_->info("Logger initialized (level={})", levelToString(level));
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::shutdown();
        logger_.reset();
    }
}

bool Logger::isInitialized() {
    return logger_ != nullptr;
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!logger_) {
        init(); // Auto-initialize with defaults
    }
    return logger_;
}

void Logger::setLevel(Level level) {
    get()->set_level(toSpdlogLevel(level));
}

void Logger::setPattern(const std::string& pattern) {
    get()->set_pattern(pattern);
}

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s = lvl;
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info") return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error" || s == "err") return Level::ERROR;
    if (s == "critical" || s == "crit") return Level::CRITICAL;
    return Level::INFO;
}

const char* Logger::levelToString(Level lvl) {
    switch (lvl) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::CRITICAL: return "critical";
    }
    return "info";
}

} // namespace utils
} // namespace vesta

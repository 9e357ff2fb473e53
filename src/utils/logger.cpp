#include "rg/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include "rg/timeutil.hpp"

namespace rg {
namespace logging {

namespace {
thread_local const char* t_step = nullptr;

const char* level_tag(Level level) {
    switch (level) {
        case Level::LVL_DEBUG: return "DEBUG";
        case Level::LVL_INFO:  return "INFO ";
        case Level::LVL_WARN:  return "WARN ";
        case Level::LVL_ERROR: return "ERROR";
        default: return "";
    }
}
} // namespace

Level Logger::threshold_ = Level::LVL_INFO;
std::mutex Logger::mutex_;

void Logger::init(Level threshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = threshold;
}

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

Level Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

void Logger::log(Level level, const char* file, int line, const std::string& message) {
    const Level threshold = Logger::level();
    if (level < threshold || level == Level::LVL_NONE) {
        return;
    }

    std::ostringstream os;
    os << format_iso8601(std::chrono::system_clock::now()) << " resolvguard " << level_tag(level);
    if (t_step) {
        os << " [" << t_step << "]";
    }
    if (threshold == Level::LVL_DEBUG) {
        os << " (" << std::filesystem::path(file).filename().string() << ":" << line << ")";
    }
    os << " " << message << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << os.str();
    if (level >= Level::LVL_WARN) {
        std::cerr << std::flush;
    }
}

void set_step(const char* step) {
    t_step = step;
}

const char* current_step() {
    return t_step;
}

Level string_to_level(const std::string& level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO;
}

bool is_level_name(const std::string& level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s == "debug" || s == "info" || s == "warn" || s == "error" || s == "none";
}

} // namespace logging
} // namespace rg

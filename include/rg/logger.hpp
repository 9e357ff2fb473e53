#pragma once

#include <mutex>
#include <sstream>
#include <string>

namespace rg {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

// One line per record on stderr:
//   2026-10-19T10:15:00.123456Z resolvguard WARN  [backup] message
// The bracketed step appears while a switch pipeline runs on the thread.
class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();

private:
    static Level threshold_;
    static std::mutex mutex_;
};

// Tags this thread's records with `step` (nullptr clears it).
void set_step(const char* step);
const char* current_step();

// Clears the step tag when the enclosing pipeline returns or throws.
class StepScope {
public:
    StepScope() = default;
    ~StepScope() { set_step(nullptr); }
    StepScope(const StepScope&) = delete;
    StepScope& operator=(const StepScope&) = delete;
};

// Unknown names map to INFO.
Level string_to_level(const std::string& level_str);
bool is_level_name(const std::string& level_str);

} // namespace logging
} // namespace rg

#define RG_LOG_INTERNAL(level, msg) \
    do { \
        std::ostringstream rg_log_ss_; \
        rg_log_ss_ << msg; \
        rg::logging::Logger::log(level, __FILE__, __LINE__, rg_log_ss_.str()); \
    } while (0)

#define RG_LOG_DEBUG(msg) RG_LOG_INTERNAL(rg::logging::Level::LVL_DEBUG, msg)
#define RG_LOG_INFO(msg)  RG_LOG_INTERNAL(rg::logging::Level::LVL_INFO, msg)
#define RG_LOG_WARN(msg)  RG_LOG_INTERNAL(rg::logging::Level::LVL_WARN, msg)
#define RG_LOG_ERROR(msg) RG_LOG_INTERNAL(rg::logging::Level::LVL_ERROR, msg)

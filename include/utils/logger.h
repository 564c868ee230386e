#pragma once

// Windows compatibility - undef macros that conflict with Logger::Level
#ifdef ERROR
#undef ERROR
#endif

#include <string>
#include <memory>

namespace spdlog { class logger; }

namespace statlas {
namespace utils {

/**
 * @brief Process-wide logger shared by the caller thread and the fetch tasks
 *
 * Writes to stderr and, when configured, to a file. Messages logged before
 * init() are dropped.
 */
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF };

    /// Replaces any previous logger. Empty log_file logs to stderr only
    static void init(const std::string& log_file = "", Level level = Level::INFO);

    static bool initialized();

    /// Case-insensitive; unknown names map to INFO
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
} // namespace statlas

#include "utils/logger_impl.h"

#define STATLAS_TRACE(...) ::statlas::utils::Logger::trace(__VA_ARGS__)
#define STATLAS_DEBUG(...) ::statlas::utils::Logger::debug(__VA_ARGS__)
#define STATLAS_INFO(...) ::statlas::utils::Logger::info(__VA_ARGS__)
#define STATLAS_WARN(...) ::statlas::utils::Logger::warn(__VA_ARGS__)
#define STATLAS_ERROR(...) ::statlas::utils::Logger::error(__VA_ARGS__)
#define STATLAS_CRITICAL(...) ::statlas::utils::Logger::critical(__VA_ARGS__)

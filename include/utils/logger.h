#pragma once

// Windows compatibility - undef macros that conflict with Logger::Level
#ifdef ERROR
#undef ERROR
#endif

#include <string>
#include <memory>

namespace spdlog { class logger; }

namespace p11mux {
namespace utils {

/**
 * Process-wide logging facade over spdlog.
 *
 * The library itself never calls init(): until the host application does,
 * every P11MUX_* macro is a no-op. Passing an empty log_file logs to the
 * console only.
 */
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    static void init(const std::string& log_file = "", Level level = Level::INFO);
    static void shutdown();
    static std::shared_ptr<spdlog::logger> get();
    static bool isInitialized();
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
    template<typename FormatString, typename... Args>
    static void write(Level level, FormatString&& fmt, Args&&... args);

    // spdlog::level::level_enum value for level
    static int spdlogLevel(Level level);

    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace p11mux

// Include implementation
#include "utils/logger_impl.h"

// Logging macros
#define P11MUX_TRACE(...) ::p11mux::utils::Logger::trace(__VA_ARGS__)
#define P11MUX_DEBUG(...) ::p11mux::utils::Logger::debug(__VA_ARGS__)
#define P11MUX_INFO(...) ::p11mux::utils::Logger::info(__VA_ARGS__)
#define P11MUX_WARN(...) ::p11mux::utils::Logger::warn(__VA_ARGS__)
#define P11MUX_ERROR(...) ::p11mux::utils::Logger::error(__VA_ARGS__)
#define P11MUX_CRITICAL(...) ::p11mux::utils::Logger::critical(__VA_ARGS__)

#pragma once

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace p11mux {
namespace utils {

// logger_ is read without synchronization; init() and shutdown() belong to
// process start and stop, not to running threads.
template<typename FormatString, typename... Args>
void Logger::write(Level level, FormatString&& fmt, Args&&... args) {
    if (!logger_) return;
    const auto lvl = static_cast<spdlog::level::level_enum>(spdlogLevel(level));
    if (!logger_->should_log(lvl)) return;
    logger_->log(lvl, fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::trace(FormatString&& fmt, Args&&... args) {
    write(Level::TRACE, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::debug(FormatString&& fmt, Args&&... args) {
    write(Level::DEBUG, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::info(FormatString&& fmt, Args&&... args) {
    write(Level::INFO, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::warn(FormatString&& fmt, Args&&... args) {
    write(Level::WARN, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::error(FormatString&& fmt, Args&&... args) {
    write(Level::ERROR, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::critical(FormatString&& fmt, Args&&... args) {
    write(Level::CRITICAL, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

} // namespace utils
} // namespace p11mux

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace wirepod::log {

using LogHandler = std::function<void(std::string_view)>;

// Messages below the threshold are dropped before reaching a handler.
enum class LogLevel { Info, Error, Off };

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void setLogLevel(LogLevel level);
LogLevel logLevel();

void logInfo(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logInfo(First&& first, Rest&&... rest) {
    if (logLevel() != LogLevel::Info) {
        return;
    }
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logInfo(std::string_view(msg));
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logError(First&& first, Rest&&... rest) {
    if (logLevel() == LogLevel::Off) {
        return;
    }
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logError(std::string_view(msg));
}

/** RAII helper that swaps the log threshold for the lifetime of the object. */
class ScopedLogLevel {
public:
    explicit ScopedLogLevel(LogLevel level)
    : previous_(logLevel()) {
        setLogLevel(level);
    }

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

    ~ScopedLogLevel() {
        setLogLevel(previous_);
    }

private:
    LogLevel previous_;
};

} // namespace wirepod::log

namespace wirepod {
using log::LogHandler;
using log::LogLevel;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::setLogLevel;
using log::logInfo;
using log::logError;
} // namespace wirepod

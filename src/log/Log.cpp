#include "wirepod/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace wirepod::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();
std::atomic<LogLevel> threshold{LogLevel::Info};

LogHandler currentHandler(const LogHandler& slot) {
    std::lock_guard lock(sinkMutex);
    return slot;
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    infoHandler = handler ? std::move(handler) : makeDefaultInfoSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    errorHandler = makeDefaultErrorSink();
}

void setLogLevel(LogLevel level) {
    threshold.store(level);
}

LogLevel logLevel() {
    return threshold.load();
}

void logInfo(std::string_view message) {
    if (logLevel() != LogLevel::Info) {
        return;
    }
    LogHandler handler = currentHandler(infoHandler);
    if (handler) {
        handler(message);
    }
}

void logError(std::string_view message) {
    if (logLevel() == LogLevel::Off) {
        return;
    }
    LogHandler handler = currentHandler(errorHandler);
    if (handler) {
        handler(message);
    }
}

} // namespace wirepod::log

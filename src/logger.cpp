#include "logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <print>

namespace {

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tm);
    return timeBuf;
}

} // namespace

std::string_view logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

ConsoleLogger::ConsoleLogger(bool verbose, const std::string& logFile) : verbose(verbose) {
    if (!logFile.empty()) {
        file.open(logFile, std::ios::app);
        if (!file.is_open()) {
            std::println(stderr, "Error: Cannot write to log file: {}", logFile);
        }
    }
}

void ConsoleLogger::log(LogLevel level, std::string_view message) {
    if (level == LogLevel::Debug && !verbose) {
        return;
    }
    std::string logEntry = std::format("[{}] {} {}", currentTimestamp(), logLevelName(level), message);

    std::lock_guard<std::mutex> lock(mutex);
    if (level == LogLevel::Warning || level == LogLevel::Error) {
        std::println(stderr, "{}", logEntry);
    } else {
        std::println("{}", logEntry);
    }

    if (file.is_open()) {
        file << logEntry << '\n';
        file.flush();
    }
}

/**
 * @file logger.hpp
 * @brief Logging facility for HomeVault.
 *
 * Components receive a Logger reference at construction instead of reaching for a
 * process-wide handle. The console implementation prints timestamped lines and can
 * mirror them into a log file.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <format>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

/**
 * @brief Severity of a log line.
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Returns the printable name of a log level ("DEBUG", "INFO", ...).
 */
std::string_view logLevelName(LogLevel level);

/**
 * @brief Interface for log sinks.
 *
 * Implementations must be safe to call from several threads at once, since archive
 * workers log concurrently.
 */
class Logger {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~Logger() = default;

    /**
     * @brief Writes one log line.
     *
     * @param level Severity of the message.
     * @param message Message text without trailing newline.
     */
    virtual void log(LogLevel level, std::string_view message) = 0;

    /**
     * @brief Returns true if debug lines are emitted.
     */
    virtual bool debugEnabled() const = 0;

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        if (debugEnabled()) {
            log(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
    }
};

/**
 * @brief Console logger with optional log file.
 *
 * Info and debug lines go to stdout, warnings and errors to stderr. Every line is
 * prefixed with a local timestamp and the level name.
 */
class ConsoleLogger : public Logger {
public:
    /**
     * @brief Constructs a console logger.
     *
     * @param verbose If true, debug lines are printed.
     * @param logFile Optional path of a file that receives a copy of every line.
     * @note An unopenable log file is reported once on stderr and then ignored.
     */
    explicit ConsoleLogger(bool verbose = false, const std::string& logFile = {});

    void log(LogLevel level, std::string_view message) override;
    bool debugEnabled() const override { return verbose; }

private:
    bool verbose;
    std::ofstream file;
    std::mutex mutex;
};

#endif // LOGGER_HPP

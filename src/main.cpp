#include <csignal>
#include <exception>
#include <print>
#include <string>
#include <vector>
#include "backup.hpp"
#include "backup_config.hpp"
#include "logger.hpp"

#ifndef HOMEVAULT_VERSION
#define HOMEVAULT_VERSION "0.0.0"
#endif

int main(int argc, char* argv[]) {
#ifndef _WIN32
    // Sync tools that exit early must not kill us through the upload pipe.
    std::signal(SIGPIPE, SIG_IGN);
#endif

    std::vector<std::string> args(argv + 1, argv + argc);
    auto commandLine = parseCommandLine(args);
    if (!commandLine) {
        std::println(stderr, "Error: {}", commandLine.error());
        std::print(stderr, "{}", usage(argv[0]));
        return 1;
    }
    if (commandLine->showHelp) {
        std::print("{}", usage(argv[0]));
        return 0;
    }
    if (commandLine->showVersion) {
        std::println("homevault {}", HOMEVAULT_VERSION);
        return 0;
    }

    const BackupConfig& config = commandLine->config;
    if (!config.preview) {
        auto valid = config.validate();
        if (!valid) {
            std::println(stderr, "Error: {}", valid.error());
            return 1;
        }
    }

    try {
        ConsoleLogger logger(config.verbose, config.logFile);
        if (!commandLine->configFile.empty()) {
            logger.debug("Loaded configuration from {}", commandLine->configFile);
        }

        Backup backup(config, logger);
        if (config.preview) {
            auto summary = backup.preview();
            if (!summary) {
                std::println(stderr, "Error: {}", summary.error());
                return 1;
            }
            std::print("{}", *summary);
            return 0;
        }

        auto result = backup.execute();
        if (!result) {
            logger.error("{}", result.error());
            return 1;
        }
    } catch (const std::exception& e) {
        std::println(stderr, "Error: {}", e.what());
        return 1;
    }
    return 0;
}

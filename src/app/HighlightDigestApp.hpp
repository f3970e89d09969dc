/**
 * @file HighlightDigestApp.hpp
 * @brief Command-line front end for HighlightDigest.
 */

#pragma once

#include <string>
#include <vector>
#include "infrastructure/ConfigLoader.hpp"

namespace highlightdigest::app {

/**
 * @class HighlightDigestApp
 * @brief Parses the command line, wires the services and runs one command.
 *
 * Commands: import, send, preview, classify.
 */
class HighlightDigestApp {
public:
    /**
     * @brief Runs the command named in @p args (argv without the program name).
     * @return Exit code (0 for success).
     */
    int Run(const std::vector<std::string>& args);

    /**
     * @struct Options
     * @brief Parsed command line.
     */
    struct Options {
        std::string command;
        std::string clippingsPath;
        std::string outputPath;
        std::string settingsPath;
        int count = -1;
        bool dryRun = false;
    };

    /**
     * @brief Parses arguments.
     * @param error Receives a message when parsing fails.
     * @return True if the arguments are valid.
     */
    static bool ParseArgs(const std::vector<std::string>& args, Options& out, std::string& error);

    static std::string Usage();

private:
    int RunImport(const Options& options, const infrastructure::AppConfig& config);
    int RunSend(const infrastructure::AppConfig& config);
    int RunPreview(const infrastructure::AppConfig& config);
    int RunClassify(const infrastructure::AppConfig& config);
};

} // namespace highlightdigest::app

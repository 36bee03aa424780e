/**
 * @file process.hpp
 * @brief Runs engine command line tools through the shell.
 */

#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <optional>
#include <functional>
#include "adapter.hpp"

struct CommandResult {
    int exitCode = 0;
    std::vector<std::string> output; ///< Lines from stdout and stderr.
};

/**
 * @brief Quotes a value for /bin/sh.
 */
std::string shellQuote(std::string_view value);

/**
 * @brief Runs a command and relays its combined output line by line.
 * @return The exit code and output, or an error if the command could not be started.
 */
std::expected<CommandResult, std::string> runCommand(const std::string& command, const LogCallback& onLine = {});

/**
 * @brief Runs a command and writes its standard input through a callback.
 *
 * Output is captured in captureFile while the command runs and relayed afterwards. The
 * feed callback returns false to abort writing (for example after a write error).
 */
std::expected<CommandResult, std::string> runCommandWithInput(const std::string& command,
                                                              const std::function<bool(std::FILE*)>& feed,
                                                              const std::string& captureFile,
                                                              const LogCallback& onLine = {});

/**
 * @brief Rewrites or drops one input line. std::nullopt drops the line.
 */
using LineFilter = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Streams a text file into a command's standard input.
 *
 * Lines pass through the filter when one is given; progress reports the share of the input
 * file consumed so far.
 */
std::expected<CommandResult, std::string> streamFileToCommand(const std::string& command,
                                                              const std::string& inputPath,
                                                              const LineFilter& filter = {},
                                                              const LogCallback& onLine = {},
                                                              const ProgressCallback& onProgress = {});

#endif // PROCESS_HPP

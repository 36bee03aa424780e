#include "process.hpp"
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <sys/wait.h>
#include <fmt/format.h>

namespace {

int exitStatus(int status) {
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

void relay(const std::string& line, CommandResult& result, const LogCallback& onLine) {
    if (line.empty()) {
        return;
    }
    result.output.push_back(line);
    if (onLine) {
        onLine(line);
    }
}

} // namespace

std::string shellQuote(std::string_view value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::expected<CommandResult, std::string> runCommand(const std::string& command, const LogCallback& onLine) {
    std::string full = command + " 2>&1";
    std::FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) {
        return std::unexpected(fmt::format("Failed to start command: {}", command));
    }

    CommandResult result;
    std::string pending;
    char buf[4096];
    while (std::fgets(buf, sizeof(buf), pipe)) {
        pending += buf;
        if (!pending.empty() && pending.back() == '\n') {
            pending.pop_back();
            relay(pending, result, onLine);
            pending.clear();
        }
    }
    relay(pending, result, onLine);
    result.exitCode = exitStatus(pclose(pipe));
    return result;
}

std::expected<CommandResult, std::string> runCommandWithInput(const std::string& command,
                                                              const std::function<bool(std::FILE*)>& feed,
                                                              const std::string& captureFile,
                                                              const LogCallback& onLine) {
    std::string full = fmt::format("{} > {} 2>&1", command, shellQuote(captureFile));
    std::FILE* pipe = popen(full.c_str(), "w");
    if (!pipe) {
        return std::unexpected(fmt::format("Failed to start command: {}", command));
    }

    bool fed = feed(pipe);
    CommandResult result;
    result.exitCode = exitStatus(pclose(pipe));

    std::ifstream captured(captureFile);
    std::string line;
    while (std::getline(captured, line)) {
        relay(line, result, onLine);
    }
    captured.close();
    std::error_code ec;
    std::filesystem::remove(captureFile, ec);

    if (!fed && result.exitCode == 0) {
        result.exitCode = -1;
        result.output.push_back("Failed to stream input to command");
    }
    return result;
}

std::expected<CommandResult, std::string> streamFileToCommand(const std::string& command,
                                                              const std::string& inputPath,
                                                              const LineFilter& filter,
                                                              const LogCallback& onLine,
                                                              const ProgressCallback& onProgress) {
    std::ifstream input(inputPath, std::ios::binary);
    if (!input) {
        return std::unexpected(fmt::format("Failed to open {}", inputPath));
    }
    std::error_code ec;
    std::uintmax_t total = std::filesystem::file_size(inputPath, ec);

    auto feed = [&](std::FILE* pipe) {
        std::uintmax_t consumed = 0;
        int lastPercent = -1;
        std::string line;
        while (std::getline(input, line)) {
            consumed += line.size() + 1;
            std::optional<std::string> forwarded = filter ? filter(line) : std::optional<std::string>(line);
            if (forwarded) {
                if (std::fputs(forwarded->c_str(), pipe) == EOF || std::fputc('\n', pipe) == EOF) {
                    return false;
                }
            }
            if (onProgress && total > 0) {
                int percent = static_cast<int>(std::min<std::uintmax_t>(consumed * 100 / total, 100));
                if (percent > lastPercent) {
                    onProgress(percent);
                    lastPercent = percent;
                }
            }
        }
        return true;
    };
    return runCommandWithInput(command, feed, inputPath + ".out", onLine);
}

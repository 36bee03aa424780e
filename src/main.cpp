#include "restore_api.hpp"
#include <iostream>
#include <csignal>
#include <vector>
#include <fmt/format.h>

namespace {

void printUsage(const char* program) {
    std::cerr << fmt::format(
        "Usage:\n"
        "  {0} [--config <path>] restore --storage <id> --file <path> --target <id>\n"
        "      [--database <name>] [--map <original>=<target>]... [--skip <original>]...\n"
        "      [--privileged-user <user> --privileged-password <password>] [--detach]\n"
        "  {0} [--config <path>] status <executionId>\n"
        "  {0} [--config <path>] test <adapterConfigId>\n"
        "  {0} [--config <path>] list <storageConfigId> [dir]\n",
        program);
}

void printExecution(const Execution& execution, bool withLogs) {
    if (withLogs) {
        for (const auto& entry : execution.logs) {
            std::cout << fmt::format("[{}] {:<7} {:<18} {}", entry.timestamp, logLevelName(entry.level),
                                     entry.stage, entry.message) << std::endl;
        }
    }
    std::cout << fmt::format("Execution {}: {} ({}, {}%)", execution.id, executionStatusName(execution.status),
                             restoreStageName(execution.stage), execution.progress) << std::endl;
}

// Parses the arguments following "restore" into a request.
bool parseRestoreArguments(const std::vector<std::string>& args, RestoreRequest& request, bool& detach) {
    std::optional<std::string> privilegedUser;
    std::string privilegedPassword;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool hasValue = i + 1 < args.size();
        if (arg == "--detach") {
            detach = true;
        } else if (!hasValue) {
            std::cerr << "Error: Missing value for " << arg << std::endl;
            return false;
        } else if (arg == "--storage") {
            request.storageConfigId = args[++i];
        } else if (arg == "--file") {
            request.file = args[++i];
        } else if (arg == "--target") {
            request.targetSourceId = args[++i];
        } else if (arg == "--database") {
            request.targetDatabaseName = args[++i];
        } else if (arg == "--map") {
            const std::string& value = args[++i];
            auto separator = value.find('=');
            if (separator == std::string::npos || separator == 0) {
                std::cerr << "Error: --map expects <original>=<target>" << std::endl;
                return false;
            }
            request.databaseMapping.push_back(
                DatabaseMappingEntry{value.substr(0, separator), value.substr(separator + 1), true});
        } else if (arg == "--skip") {
            request.databaseMapping.push_back(DatabaseMappingEntry{args[++i], "", false});
        } else if (arg == "--privileged-user") {
            privilegedUser = args[++i];
        } else if (arg == "--privileged-password") {
            privilegedPassword = args[++i];
        } else {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            return false;
        }
    }
    if (privilegedUser) {
        request.privilegedAuth = PrivilegedAuth{*privilegedUser, privilegedPassword};
    }
    return true;
}

int runRestore(RestoreAPI& api, const std::vector<std::string>& args) {
    RestoreRequest request;
    bool detach = false;
    if (!parseRestoreArguments(args, request, detach)) {
        return 2;
    }

    auto started = api.startRestore(request);
    if (!started) {
        std::cerr << fmt::format("Error ({}): {}", errorKindName(started.error().kind), started.error().message) << std::endl;
        return 1;
    }
    std::cout << fmt::format("Restore started: {}", *started) << std::endl;
    if (detach) {
        // The restore runs in this process; the API destructor waits for it quietly.
        return 0;
    }

    auto finished = api.wait(*started);
    if (!finished) {
        std::cerr << "Error: Execution record disappeared" << std::endl;
        return 1;
    }
    printExecution(*finished, true);
    return finished->status == ExecutionStatus::Success ? 0 : 1;
}

int runStatus(RestoreAPI& api, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Error: status expects an execution id" << std::endl;
        return 2;
    }
    auto execution = api.status(args.front());
    if (!execution) {
        std::cerr << "Error: Execution not found: " << args.front() << std::endl;
        return 1;
    }
    printExecution(*execution, true);
    return 0;
}

int runTest(RestoreAPI& api, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Error: test expects an adapter config id" << std::endl;
        return 2;
    }
    auto result = api.testAdapter(args.front());
    if (!result) {
        std::cerr << fmt::format("Error ({}): {}", errorKindName(result.error().kind), result.error().message) << std::endl;
        return 1;
    }
    std::cout << fmt::format("{}: {}", result->success ? "OK" : "FAILED", result->message) << std::endl;
    if (result->version) {
        std::cout << "Version: " << *result->version << std::endl;
    }
    if (result->edition) {
        std::cout << "Edition: " << *result->edition << std::endl;
    }
    return result->success ? 0 : 1;
}

int runList(RestoreAPI& api, const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        std::cerr << "Error: list expects a storage config id and an optional directory" << std::endl;
        return 2;
    }
    auto files = api.listFiles(args[0], args.size() == 2 ? args[1] : "");
    if (!files) {
        std::cerr << fmt::format("Error ({}): {}", errorKindName(files.error().kind), files.error().message) << std::endl;
        return 1;
    }
    for (const auto& file : *files) {
        std::cout << fmt::format("{:<1} {:>12} {:<24} {}", file.isDirectory ? "d" : "-", file.size,
                                 file.lastModified, file.path) << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Engine clients may exit before consuming all input.
    std::signal(SIGPIPE, SIG_IGN);

    std::string configFile = "restorevault.json";
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (command.empty() && arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (command.empty()) {
            command = arg;
        } else {
            args.push_back(arg);
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        RestoreAPI api(configFile);
        if (command == "restore") {
            return runRestore(api, args);
        }
        if (command == "status") {
            return runStatus(api, args);
        }
        if (command == "test") {
            return runTest(api, args);
        }
        if (command == "list") {
            return runList(api, args);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    printUsage(argv[0]);
    return 2;
}

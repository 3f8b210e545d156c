#include "tool/Config.hpp"
#include "tool/RequestHandler.hpp"
#include "util/Logger.hpp"
#include <iostream>
#include <iterator>
#include <string>

using namespace issues::tool;
using issues::util::Logger;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <operation> [params-json|-]\n"
              << "Operations:\n"
              << "  create, list, get, update, close, add_dependency, remove_dependency,\n"
              << "  get_dependencies, get_dependents, get_ready, get_blocked, get_events,\n"
              << "  get_sessions, session_end\n"
              << "Options:\n"
              << "  -d, --data-dir DIR     Issue directory (overrides base dir + project slug)\n"
              << "  -b, --base-dir DIR     Base directory (default: ~/.issuequeue/projects)\n"
              << "  --project PATH         Project path used for the slug (default: cwd)\n"
              << "  -a, --actor NAME       Actor recorded on events (default: assistant)\n"
              << "  -s, --session ID       Session id recorded on events\n"
              << "  --config FILE          key=value settings file (@file syntax accepted)\n"
              << "  --lock-timeout MS      Lock wait in milliseconds (default: 10000)\n"
              << "  --no-create            Fail if the issue directory does not exist\n"
              << "  -l, --log-level LVL    Log level: debug, info, warn, error (default: info)\n"
              << "  --log-file PATH        Append logs to a file instead of stderr\n"
              << "  -h, --help             Show this help\n"
              << "Params are a JSON object; '-' reads it from stdin.\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    ToolConfig config;
    std::string operation;
    std::string paramsText;

    try {
        // Config file first so that flags override it
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                loadConfigFile(config, argv[++i]);
            }
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-d" || arg == "--data-dir") && i + 1 < argc) {
                config.dataDir = argv[++i];
            } else if ((arg == "-b" || arg == "--base-dir") && i + 1 < argc) {
                config.baseDir = argv[++i];
            } else if (arg == "--project" && i + 1 < argc) {
                config.projectPath = argv[++i];
            } else if ((arg == "-a" || arg == "--actor") && i + 1 < argc) {
                config.actor = argv[++i];
            } else if ((arg == "-s" || arg == "--session") && i + 1 < argc) {
                config.sessionId = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                ++i;
            } else if (arg == "--lock-timeout" && i + 1 < argc) {
                applyConfigValue(config, "lock_timeout_ms", argv[++i]);
            } else if (arg == "--no-create") {
                config.autoCreateDir = false;
            } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                applyConfigValue(config, "log_level", argv[++i]);
            } else if (arg == "--log-file" && i + 1 < argc) {
                config.logFile = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 2;
            } else if (operation.empty()) {
                operation = arg;
            } else if (paramsText.empty()) {
                paramsText = arg;
            } else {
                std::cerr << "Unexpected argument: " << arg << "\n";
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (operation.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    // Configure Logger
    Logger::instance().setLevel(Logger::parseLevel(config.logLevel));
    if (!config.logFile.empty()) {
        try {
            Logger::instance().enableFileLogging(config.logFile);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 2;
        }
    }

    if (paramsText == "-") {
        paramsText.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    json params = json::object();
    if (!paramsText.empty()) {
        try {
            params = json::parse(paramsText);
        } catch (const json::parse_error& e) {
            std::cerr << "Error: params are not valid JSON: " << e.what() << "\n";
            return 2;
        }
    }

    json response;
    try {
        RequestHandler handler(config);
        response = handler.handle(json{{"operation", operation}, {"params", params}});
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Cannot open issue store: ") + e.what());
        response = json{
            {"success", false},
            {"error", {{"kind", "storage"}, {"message", e.what()}}}
        };
    }

    std::cout << response.dump(2) << std::endl;
    return response["success"].get<bool>() ? 0 : 1;
}

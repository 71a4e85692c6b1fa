// bridge: command-line interface for agent coordination
//
// Usage: bridge [--db PATH] [--json] [--verbose] <command> [args...]
//
// Commands mirror the tools served by bridge_mcp:
//   register, agents, send, inbox, mark_read, ack,
//   lock, unlock, locks, remember, recall, forget
//
// Examples:
//   bridge register worker claude-code opus
//   bridge send coordinator worker "[TASK] build x" "details"
//   bridge lock src/auth.ts worker 60 --reason "refactor"
//   bridge recall auth --json

#include <bridge/cli.hpp>
#include <bridge/config.hpp>
#include <bridge/log.hpp>
#include <bridge/rpc/handler.hpp>
#include <bridge/store.hpp>
#include <bridge/version.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

int main(int argc, char* argv[]) {
    const char* prog = prog_name(argv[0]);
    bridge::StoreConfig config = bridge::StoreConfig::from_env();
    bool json_output = false;

    if (const char* env_verbose = std::getenv("BRIDGE_VERBOSE")) {
        bridge::log::set_verbose(bridge::parse_bool(env_verbose, false));
    }

    // Global options may sit anywhere; everything else belongs to the command
    std::string command;
    std::vector<std::string> args;
    bool passthrough = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (passthrough) {
            args.push_back(arg);
        } else if (arg == "--") {
            passthrough = true;
            args.push_back(arg);
        } else if (arg == "--db") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --db needs a path\n";
                return bridge::cli::EXIT_INVALID_INPUT;
            }
            config.path = argv[++i];
        } else if (arg == "--json") {
            json_output = true;
        } else if (arg == "--verbose") {
            bridge::log::set_verbose(true);
        } else if (arg == "--help" || arg == "-h") {
            command = "help";
        } else if (arg == "--version" || arg == "-v") {
            command = "version";
        } else if (command.empty()) {
            command = arg;
        } else {
            args.push_back(arg);
        }
    }

    if (command.empty()) {
        bridge::cli::print_usage(std::cerr, prog);
        return bridge::cli::EXIT_INVALID_INPUT;
    }
    if (command == "help") {
        bridge::cli::print_usage(std::cout, prog);
        return bridge::cli::EXIT_OK;
    }
    if (command == "version") {
        std::cout << "bridge " << BRIDGE_VERSION << " (schema v" << BRIDGE_SCHEMA_VERSION << ")\n";
        return bridge::cli::EXIT_OK;
    }
    if (!bridge::cli::find_command(command)) {
        std::cerr << "Error: Unknown command: " << command << "\n\n";
        bridge::cli::print_usage(std::cerr, prog);
        return bridge::cli::EXIT_INVALID_INPUT;
    }

    try {
        bridge::Store store(config);
        bridge::rpc::Handler handler(&store);
        return bridge::cli::run(handler, command, args, std::cout, std::cerr, json_output);
    } catch (const bridge::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return bridge::cli::exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return bridge::cli::EXIT_FAILURE_INTERNAL;
    }
}

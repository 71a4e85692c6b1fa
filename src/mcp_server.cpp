// Agent Bridge MCP Server
// Tool server for agent coordination over stdio
//
// Usage:
//   bridge_mcp [options]
//
// Options:
//   --db PATH     SQLite database (default: ~/.agent-bridge/bridge.db)
//   --verbose     Debug logging on stderr
//
// Host configuration (e.g. ~/.claude.json):
//   { "mcpServers": { "bridge": { "command": "bridge_mcp" } } }

#include <bridge/config.hpp>
#include <bridge/error.hpp>
#include <bridge/log.hpp>
#include <bridge/rpc/server.hpp>
#include <bridge/store.hpp>
#include <bridge/version.hpp>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --db PATH     SQLite database (default: ~/.agent-bridge/bridge.db)\n"
              << "  --verbose     Debug logging on stderr\n"
              << "  --version     Show version\n"
              << "  --help        Show this help message\n"
              << "\n"
              << "Speaks line-delimited JSON-RPC 2.0 (MCP) on stdin/stdout.\n";
}

int main(int argc, char* argv[]) {
    bridge::StoreConfig config = bridge::StoreConfig::from_env();

    if (const char* env_verbose = std::getenv("BRIDGE_VERBOSE")) {
        bridge::log::set_verbose(bridge::parse_bool(env_verbose, false));
    }

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            config.path = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            bridge::log::set_verbose(true);
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "bridge_mcp " << BRIDGE_VERSION << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        bridge::Store store(config);
        bridge::log_debug("mcp", "store ready at %s", config.path.c_str());

        bridge::rpc::Server server(&store);
        server.run();
    } catch (const bridge::Error& e) {
        bridge::log_error("mcp", "%s", e.what());
        return 1;
    } catch (const std::exception& e) {
        bridge::log_error("mcp", "fatal: %s", e.what());
        return 1;
    }

    return 0;
}

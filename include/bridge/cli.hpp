#pragma once
// CLI: map `bridge <command> args...` onto tool calls
//
// Every command is a tool of the same name. Positional arguments fill the
// tool's parameters in a fixed order; --flags fill the rest. Anything
// after `--` is positional even if it starts with a dash.

#include "error.hpp"
#include "rpc/handler.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace bridge::cli {

using json = nlohmann::json;

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_INTERNAL = 1;
constexpr int EXIT_INVALID_INPUT = 2;
constexpr int EXIT_NOT_FOUND = 3;
constexpr int EXIT_CONFLICT = 4;
constexpr int EXIT_FORBIDDEN = 5;

inline int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return EXIT_INVALID_INPUT;
        case ErrorKind::NotFound: return EXIT_NOT_FOUND;
        case ErrorKind::Conflict: return EXIT_CONFLICT;
        case ErrorKind::Forbidden: return EXIT_FORBIDDEN;
        case ErrorKind::Storage: return EXIT_FAILURE_INTERNAL;
    }
    return EXIT_FAILURE_INTERNAL;
}

inline int exit_code_for(const std::string& kind) {
    for (ErrorKind k : {ErrorKind::NotFound, ErrorKind::Conflict, ErrorKind::Forbidden,
                        ErrorKind::InvalidInput, ErrorKind::Storage}) {
        if (kind == to_string(k)) return exit_code_for(k);
    }
    return EXIT_FAILURE_INTERNAL;
}

enum class FlagKind {
    Value,      // --flag VALUE
    SetTrue,    // --flag  => key = true
    SetFalse    // --flag  => key = false
};

struct Flag {
    const char* name;
    const char* key;
    FlagKind kind;
};

struct Command {
    const char* name;
    std::vector<const char*> positional;   // parameter names in order
    size_t required;                       // leading positionals that must be given
    std::vector<Flag> flags;
    const char* usage;
};

inline const std::vector<Command>& commands() {
    static const std::vector<Command> table = {
        {"register", {"name", "program", "model"}, 1,
         {{"--task", "task", FlagKind::Value}, {"--status", "status", FlagKind::Value}},
         "register <name> [program] [model] [--task T] [--status S]"},
        {"agents", {}, 0, {},
         "agents"},
        {"send", {"sender", "recipient", "subject", "body"}, 3,
         {{"--thread", "thread_id", FlagKind::Value}},
         "send <sender> <recipient> <subject> [body] [--thread ID]"},
        {"inbox", {"agent"}, 1,
         {{"--unread", "unread_only", FlagKind::SetTrue}, {"--limit", "limit", FlagKind::Value}},
         "inbox <agent> [--unread] [--limit N]"},
        {"mark_read", {"message_id"}, 1,
         {{"--agent", "agent", FlagKind::Value}},
         "mark_read <message_id> [--agent A]"},
        {"ack", {"message_id"}, 1,
         {{"--agent", "agent", FlagKind::Value}},
         "ack <message_id> [--agent A]"},
        {"lock", {"path", "agent", "ttl_seconds"}, 2,
         {{"--reason", "reason", FlagKind::Value}, {"--ttl", "ttl_seconds", FlagKind::Value}},
         "lock <path> <agent> [ttl_seconds] [--reason R]"},
        {"unlock", {"path", "agent"}, 2, {},
         "unlock <path> <agent>"},
        {"locks", {}, 0,
         {{"--all", "active_only", FlagKind::SetFalse}, {"--agent", "agent", FlagKind::Value}},
         "locks [--all] [--agent A]"},
        {"remember", {"content"}, 1,
         {{"--tags", "tags", FlagKind::Value}, {"--tag", "tags", FlagKind::Value}},
         "remember <content> [--tags a,b,c]"},
        {"recall", {"query", "limit"}, 0, {},
         "recall <query> [limit]"},
        {"forget", {"id"}, 1, {},
         "forget <memory_id>"},
    };
    return table;
}

inline const Command* find_command(const std::string& name) {
    for (const auto& c : commands()) {
        if (name == c.name) return &c;
    }
    return nullptr;
}

inline void print_usage(std::ostream& os, const char* prog) {
    os << "bridge " << BRIDGE_VERSION << " - coordination for coding agents\n\n"
       << "Usage: " << prog << " [--db PATH] [--json] [--verbose] <command> [args...]\n\n"
       << "Commands:\n";
    for (const auto& c : commands()) {
        os << "  " << c.usage << "\n";
    }
    os << "  version\n"
       << "  help\n\n"
       << "Options:\n"
       << "  --db PATH     SQLite database (default: ~/.agent-bridge/bridge.db, or $BRIDGE_DB_PATH)\n"
       << "  --json        Print structured JSON instead of text\n"
       << "  --verbose     Debug logging on stderr\n\n"
       << "Subject tags: [TASK] [DONE] [BLOCKED] [QUESTION] [HANDOFF]\n";
}

// Tool arguments for one command line. Throws InvalidInput on usage errors.
inline json build_arguments(const Command& cmd, const std::vector<std::string>& args) {
    json out = json::object();
    size_t next_positional = 0;
    bool only_positional = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (!only_positional && arg == "--") {
            only_positional = true;
            continue;
        }

        if (!only_positional && arg.rfind("--", 0) == 0) {
            const Flag* flag = nullptr;
            for (const auto& f : cmd.flags) {
                if (arg == f.name) { flag = &f; break; }
            }

            if (flag && flag->kind == FlagKind::SetTrue) {
                out[flag->key] = true;
                continue;
            }
            if (flag && flag->kind == FlagKind::SetFalse) {
                out[flag->key] = false;
                continue;
            }

            // Declared value flag, or a raw --<parameter> passthrough
            std::string key = flag ? flag->key : arg.substr(2);
            if (i + 1 >= args.size()) {
                throw invalid_input("Option " + arg + " needs a value");
            }
            out[key] = args[++i];
            continue;
        }

        if (next_positional >= cmd.positional.size()) {
            throw invalid_input(std::string("Too many arguments for ") + cmd.name +
                                "\nUsage: bridge " + cmd.usage);
        }
        out[cmd.positional[next_positional++]] = arg;
    }

    if (next_positional < cmd.required) {
        bool satisfied = true;
        for (size_t p = next_positional; p < cmd.required; ++p) {
            if (!out.contains(cmd.positional[p])) satisfied = false;
        }
        if (!satisfied) {
            throw invalid_input(std::string("Missing arguments for ") + cmd.name +
                                "\nUsage: bridge " + cmd.usage);
        }
    }

    // `bridge recall` with no query lists the latest memories
    if (std::string(cmd.name) == "recall" && !out.contains("query")) {
        out["query"] = "";
    }
    return out;
}

// Stored text is raw argv bytes; bad UTF-8 is replaced on output
inline std::string pretty(const json& structured) {
    return structured.dump(2, ' ', false, json::error_handler_t::replace);
}

// Run one command against the handler. Results go to out, errors to err.
inline int run(rpc::Handler& handler, const std::string& command,
               const std::vector<std::string>& args,
               std::ostream& out, std::ostream& err, bool json_output) {
    const Command* cmd = find_command(command);
    if (!cmd) {
        err << "Error: Unknown command: " << command << " (try 'bridge help')\n";
        return EXIT_INVALID_INPUT;
    }

    rpc::ToolResult result;
    try {
        result = handler.call(cmd->name, build_arguments(*cmd, args));
    } catch (const Error& e) {
        err << "Error: " << e.what() << "\n";
        return exit_code_for(e.kind());
    }

    if (result.is_error) {
        std::string kind;
        if (result.structured.contains("error")) {
            kind = result.structured["error"].value("kind", "");
        }
        if (json_output) out << pretty(result.structured) << "\n";
        err << result.content << "\n";
        return exit_code_for(kind);
    }

    if (json_output) {
        out << pretty(result.structured) << "\n";
    } else {
        out << result.content << "\n";
    }
    return EXIT_OK;
}

} // namespace bridge::cli

#pragma once
// RPC Server: JSON-RPC 2.0 over stdio for MCP hosts
//
// One request per line in, one response per line out. Runs until the
// input closes or stop() is called; each request is handled to
// completion before the next line is read.

#include "handler.hpp"
#include "../log.hpp"
#include <atomic>
#include <iostream>
#include <string>

namespace bridge::rpc {

class Server {
public:
    explicit Server(Store* store) : handler_(store), running_(false) {}

    void run(std::istream& in = std::cin, std::ostream& out = std::cout) {
        running_ = true;
        std::string line;
        size_t served = 0;

        while (running_ && std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            std::string response = handler_.handle(line);
            ++served;
            if (response.empty()) continue;

            out << response << "\n";
            out.flush();
        }

        running_ = false;
        log_debug("mcp", "input closed after %zu requests", served);
    }

    void stop() { running_ = false; }

    Handler& handler() { return handler_; }

private:
    Handler handler_;
    std::atomic<bool> running_;
};

} // namespace bridge::rpc

#pragma once
// RPC Protocol: JSON-RPC 2.0 helpers and error codes
//
// Line-delimited JSON-RPC as spoken by MCP hosts: one request object per
// line in, one reply object per line out. Requests without an id, and
// anything under notifications/, get no reply.

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace bridge::rpc {

using json = nlohmann::json;

// Replace invalid UTF-8 with U+FFFD; json::dump throws on bad bytes
inline std::string sanitize_utf8(const std::string& input) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";

    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        size_t len = c < 0x80 ? 1
                   : (c & 0xE0) == 0xC0 ? 2
                   : (c & 0xF0) == 0xE0 ? 3
                   : (c & 0xF8) == 0xF0 ? 4
                   : 0;

        bool valid = len > 0 && i + len <= input.size();
        for (size_t k = 1; valid && k < len; ++k) {
            valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
        }

        if (valid) {
            output.append(input, i, len);
            i += len;
        } else {
            output += REPLACEMENT;
            ++i;
        }
    }
    return output;
}

// Codes carried in "error.code"; -32000..-32099 belong to the server
enum class ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    UnknownTool = -32001,
    ToolFailed = -32002
};

inline int code(ErrorCode c) { return static_cast<int>(c); }

// Frame to wire text. Bad bytes that reach a payload are replaced, never thrown.
inline std::string encode(const json& frame) {
    return frame.dump(-1, ' ', false, json::error_handler_t::replace);
}

namespace reply {

inline json success(const json& id, json result) {
    json frame = json::object();
    frame["jsonrpc"] = "2.0";
    frame["id"] = id;
    frame["result"] = std::move(result);
    return frame;
}

// message may quote the rejected input, so it is cleaned first
inline json failure(const json& id, ErrorCode c, const std::string& message) {
    json frame = json::object();
    frame["jsonrpc"] = "2.0";
    frame["id"] = id;
    frame["error"] = {{"code", code(c)}, {"message", sanitize_utf8(message)}};
    return frame;
}

// tools/call result: one text block, the error flag, and the structured
// copy when the tool produced one
inline json tool_output(const std::string& text, bool is_error, const json& structured) {
    json out = json::object();
    out["content"] = json::array({{{"type", "text"}, {"text", sanitize_utf8(text)}}});
    out["isError"] = is_error;
    if (!structured.is_null()) out["structured"] = structured;
    return out;
}

} // namespace reply

struct Request {
    std::string method;
    json params;
    json id;              // null when absent
    bool wants_reply;     // false for id-less requests

    // notifications/initialized, notifications/cancelled, ...
    bool is_notification() const { return method.rfind("notifications/", 0) == 0; }
};

// Envelope check. On failure `problem` says what is wrong.
inline bool decode_request(const json& frame, Request& out, std::string& problem) {
    if (!frame.is_object()) {
        problem = "Request must be a JSON object";
        return false;
    }
    auto version = frame.find("jsonrpc");
    if (version == frame.end() || *version != "2.0") {
        problem = "Missing or invalid jsonrpc version";
        return false;
    }
    auto method = frame.find("method");
    if (method == frame.end() || !method->is_string()) {
        problem = "Missing or invalid method";
        return false;
    }

    out.method = method->get<std::string>();
    out.params = frame.value("params", json::object());
    if (out.params.is_null()) out.params = json::object();
    out.wants_reply = frame.contains("id");
    out.id = out.wants_reply ? frame["id"] : json();
    return true;
}

} // namespace bridge::rpc

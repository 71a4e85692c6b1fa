#pragma once
// Errors surfaced by the store
//
// Every failure is thrown as bridge::Error with a kind. Surfaces map the
// kind to their own reporting: exit codes for the CLI, isError results
// for tool calls.

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace bridge {

enum class ErrorKind {
    NotFound,
    Conflict,
    Forbidden,
    InvalidInput,
    Storage
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::Forbidden: return "forbidden";
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::Storage: return "storage";
    }
    return "unknown";
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Lock held by another agent
class LockConflict : public Error {
public:
    LockConflict(std::string path, std::string holder, int64_t remaining_seconds)
        : Error(ErrorKind::Conflict,
                path + " is locked by " + holder + " (expires in " +
                std::to_string(remaining_seconds) + "s)"),
          path_(std::move(path)),
          holder_(std::move(holder)),
          remaining_seconds_(remaining_seconds) {}

    const std::string& path() const { return path_; }
    const std::string& holder() const { return holder_; }
    int64_t remaining_seconds() const { return remaining_seconds_; }

private:
    std::string path_;
    std::string holder_;
    int64_t remaining_seconds_;
};

inline Error invalid_input(const std::string& message) {
    return Error(ErrorKind::InvalidInput, message);
}

inline Error not_found(const std::string& message) {
    return Error(ErrorKind::NotFound, message);
}

} // namespace bridge

#pragma once

#include <string>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result
struct SSHResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
};

// Which remote stream a chunk of output came from
enum class StreamKind {
    STDOUT,
    STDERR,
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

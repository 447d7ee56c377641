#pragma once

#include <map>
#include <string>
#include <utility>
#include <variant>
#include "error.hpp"

// Per-host outcome: either the operation's success payload or a HostError.
template <typename T>
class HostResult {
public:
    static HostResult<T> Ok(T value) {
        return HostResult<T>(std::variant<T, HostError>(std::in_place_index<0>, std::move(value)));
    }

    static HostResult<T> Err(HostError error) {
        return HostResult<T>(std::variant<T, HostError>(std::in_place_index<1>, std::move(error)));
    }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    const T& value() const { return std::get<0>(data_); }
    T& value() { return std::get<0>(data_); }
    const HostError& error() const { return std::get<1>(data_); }

    // Kind of failure; only meaningful when is_err().
    ErrorKind kind() const { return error().kind; }

private:
    explicit HostResult(std::variant<T, HostError> data) : data_(std::move(data)) {}

    std::variant<T, HostError> data_;
};

// Complete per-host mapping returned by a batch, keyed by host entry.
template <typename T>
using BatchResult = std::map<std::string, HostResult<T>>;

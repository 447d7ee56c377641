#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <core/host.hpp>

enum class ActionKind {
    CALL,
    COPY,
    SLURP,
};

const char* action_kind_name(ActionKind kind);

// Per-host unit of work within a batch. Created once when the batch starts
// and never mutated afterwards.
struct Task {
    size_t index;         // position in the caller's host list
    std::string key;      // result map key
    HostSpec host;
    ActionKind kind;
};

// Build one task per host. The first occurrence of a host entry is keyed by
// the entry itself; repeats become "<entry>.1", "<entry>.2", ... so every
// occurrence keeps its own result.
std::vector<Task> make_tasks(const std::vector<HostSpec>& hosts, ActionKind kind);

#pragma once

#include <cstdint>
#include <functional>
#include <memory>

// Shared cancellation flag with abort hooks.
//
// Copies of a token share one state. cancel() is idempotent: the first call
// flips the flag and runs every registered hook exactly once, later calls do
// nothing. Hooks are how blocking work is forced to return (e.g. a session
// shuts its socket down), so they must be quick and must not block.
class CancelToken {
public:
    using Hook = std::function<void()>;

    CancelToken();

    void cancel();
    bool cancelled() const;

    // Register a hook. If the token is already cancelled the hook runs
    // immediately on the calling thread and 0 is returned.
    uint64_t subscribe(Hook hook);

    // Remove a hook. When this returns the hook is neither running nor
    // going to run, so whatever it references may be destroyed.
    void unsubscribe(uint64_t id);

private:
    struct State;
    std::shared_ptr<State> state_;
};

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <ssh/remote.hpp>

// Scripted behaviour of one mock host.
struct MockBehavior {
    SSHErrc connect_error = SSHErrc::OK;        // returned by establish()
    std::string connect_message = "refused";
    std::chrono::milliseconds delay{0};         // per exec/put/get, cut short by abort()
    bool hang = false;                          // block until abort()
    bool hang_on_close = false;                 // close() blocks until abort()
    bool throw_in_exec = false;
    SSHResult exec_result{0, "hi\n", ""};
    SSHErrc exec_error = SSHErrc::OK;
    SSHErrc put_error = SSHErrc::OK;
    SSHErrc get_error = SSHErrc::OK;
    std::string get_content = "remote data";
};

// Everything the mock saw for one session.
struct MockCall {
    SessionTarget target;
    std::string command;
    std::string input;
    std::vector<std::pair<std::string, std::string>> env;
    std::string put_local;
    std::string put_remote;
    std::string get_remote;
    std::string get_local;
    bool aborted = false;
};

class MockTransport;

class MockSession : public RemoteSession {
public:
    MockSession(MockTransport& owner, SessionTarget target, MockBehavior behavior);
    ~MockSession() override { close(); }

    SSHStatus establish() override {
        if (behavior_.connect_error != SSHErrc::OK) {
            return SSHStatus::Err(behavior_.connect_error, behavior_.connect_message);
        }
        return SSHStatus::Ok();
    }

    SSHStatus exec(const ExecRequest& request, SSHResult& result) override {
        call_.command = request.command;
        call_.input = request.input;
        call_.env = request.env;
        if (!wait()) return SSHStatus::Err(SSHErrc::ABORTED, "aborted");
        if (behavior_.throw_in_exec) throw std::runtime_error("mock exploded");

        result = behavior_.exec_result;
        if (behavior_.exec_error != SSHErrc::OK) {
            return SSHStatus::Err(behavior_.exec_error, "mock exec failure");
        }
        if (request.on_chunk) {
            if (!result.stdout_data.empty()) {
                request.on_chunk(StreamKind::STDOUT, result.stdout_data.data(), result.stdout_data.size());
            }
            if (!result.stderr_data.empty()) {
                request.on_chunk(StreamKind::STDERR, result.stderr_data.data(), result.stderr_data.size());
            }
        }
        if (!request.keep_output) {
            result.stdout_data.clear();
            result.stderr_data.clear();
        }
        return SSHStatus::Ok();
    }

    SSHStatus put(const fs::path& local, const std::string& remote,
                  const TransferFlags& /*flags*/, std::string& written) override {
        call_.put_local = local.string();
        call_.put_remote = remote;
        if (!wait()) return SSHStatus::Err(SSHErrc::ABORTED, "aborted");
        if (behavior_.put_error != SSHErrc::OK) {
            return SSHStatus::Err(behavior_.put_error, "mock rejected transfer");
        }
        written = (!remote.empty() && remote.back() == '/') ? remote + local.filename().string() : remote;
        return SSHStatus::Ok();
    }

    SSHStatus get(const std::string& remote, const fs::path& local,
                  const TransferFlags& /*flags*/, std::string& written) override {
        call_.get_remote = remote;
        call_.get_local = local.string();
        if (!wait()) return SSHStatus::Err(SSHErrc::ABORTED, "aborted");
        if (behavior_.get_error != SSHErrc::OK) {
            return SSHStatus::Err(behavior_.get_error, "mock rejected transfer");
        }
        std::ofstream out(local, std::ios::binary);
        if (!out) return SSHStatus::Err(SSHErrc::LOCAL_IO, "cannot write " + local.string());
        out << behavior_.get_content;
        written = local.string();
        return SSHStatus::Ok();
    }

    void close() override;

    void abort() override {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
        cv_.notify_all();
    }

private:
    // Sleep for the scripted delay (or forever when hanging) unless aborted.
    bool wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (behavior_.hang) {
            cv_.wait(lock, [this] { return aborted_; });
        } else if (behavior_.delay.count() > 0) {
            cv_.wait_for(lock, behavior_.delay, [this] { return aborted_; });
        }
        return !aborted_;
    }

    MockTransport& owner_;
    MockBehavior behavior_;
    MockCall call_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool aborted_ = false;
    bool closed_ = false;
};

// SSHTransport whose sessions follow per-host scripts. Also counts how many
// sessions are open at once.
class MockTransport : public SSHTransport {
public:
    MockBehavior default_behavior;

    void script(const std::string& host, MockBehavior behavior) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[host] = std::move(behavior);
    }

    std::unique_ptr<RemoteSession> open(const SessionTarget& target) override {
        MockBehavior behavior;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = scripts_.find(target.host);
            behavior = (it != scripts_.end()) ? it->second : default_behavior;
            ++opened_;
        }
        int now = ++open_now_;
        int peak = max_open_.load();
        while (now > peak && !max_open_.compare_exchange_weak(peak, now)) {}
        return std::make_unique<MockSession>(*this, target, behavior);
    }

    void session_closed(MockCall call) {
        --open_now_;
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(std::move(call));
    }

    int max_open() const { return max_open_.load(); }
    int open_now() const { return open_now_.load(); }

    int opened() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opened_;
    }

    std::vector<MockCall> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    // Calls recorded for the first closed session to host.
    MockCall call_for(const std::string& host) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& c : calls_) {
            if (c.target.host == host) return c;
        }
        return MockCall{};
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, MockBehavior> scripts_;
    std::vector<MockCall> calls_;
    int opened_ = 0;
    std::atomic<int> open_now_{0};
    std::atomic<int> max_open_{0};
};

inline MockSession::MockSession(MockTransport& owner, SessionTarget target, MockBehavior behavior)
    : owner_(owner), behavior_(std::move(behavior)) {
    call_.target = std::move(target);
}

inline void MockSession::close() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        // A peer that never answers the disconnect.
        if (behavior_.hang_on_close) {
            cv_.wait(lock, [this] { return aborted_; });
        }
        call_.aborted = aborted_;
    }
    owner_.session_closed(call_);
}

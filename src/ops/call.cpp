#include "call.hpp"
#include "session_action.hpp"
#include <core/log.hpp>
#include <dispatch/dispatch.hpp>
#include <ssh/transport.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

static std::string prepare_dir(const std::string& dir, const char* what) {
    if (dir.empty()) return "";
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return fmt::format("cannot create {} {}: {}", what, dir, ec.message());
    return "";
}

// Per-host output files under outdir/errdir, opened when the command starts.
struct OutputFiles {
    std::unique_ptr<std::ofstream> out;
    std::unique_ptr<std::ofstream> err;

    std::string open(const Options& options, const std::string& key) {
        if (!options.outdir.empty()) {
            auto path = fs::path(options.outdir) / key;
            out = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
            if (!*out) return "Cannot write output file " + path.string();
        }
        if (!options.errdir.empty()) {
            auto path = fs::path(options.errdir) / key;
            err = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
            if (!*err) return "Cannot write error file " + path.string();
        }
        return "";
    }

    void write(StreamKind stream, const char* data, size_t len) {
        auto& file = (stream == StreamKind::STDOUT) ? out : err;
        if (file) file->write(data, static_cast<std::streamsize>(len));
    }
};

Result<BatchResult<SSHResult>> call(SSHTransport& transport, const std::vector<HostSpec>& hosts,
                                    const std::string& command, const Options& options) {
    using Batch = Result<BatchResult<SSHResult>>;

    std::string problem = validate_hosts(hosts);
    if (problem.empty()) problem = validate_options(options);
    if (problem.empty() && command.empty()) problem = "no command given";
    if (problem.empty()) problem = prepare_dir(options.outdir, "output directory");
    if (problem.empty()) problem = prepare_dir(options.errdir, "error directory");
    if (!problem.empty()) {
        fanout_log("call rejected: " + problem);
        return Batch::Err(problem);
    }

    auto tasks = make_tasks(hosts, ActionKind::CALL);
    fanout_log(fmt::format("call: {} hosts, par {}, command: {}",
                           tasks.size(), options.concurrency, command));

    HostAction<SSHResult> action = [&](const Task& task, TaskContext& ctx) {
        SessionBody<SSHResult> body = [&](RemoteSession& session) {
            OutputFiles files;
            std::string file_error = files.open(options, task.key);
            if (!file_error.empty()) {
                return HostResult<SSHResult>::Err(
                    HostError{task.key, ErrorKind::EXECUTION, file_error, ""});
            }

            bool streamed = options.output == OutputMode::STREAMED;
            ExecRequest request;
            request.command = command;
            request.input = options.input;
            request.env = {{ENV_NODENUM, std::to_string(task.index)},
                           {ENV_HOST, task.host.host}};
            request.keep_output = !streamed;
            request.on_chunk = [&](StreamKind stream, const char* data, size_t len) {
                files.write(stream, data, len);
                if (streamed) options.on_output(task.key, stream, data, len);
            };

            SSHResult result;
            SSHStatus status = session.exec(request, result);
            fanout_log_exec(task.key, command, result);
            if (!status.ok()) {
                return HostResult<SSHResult>::Err(
                    make_error(task, status, SessionPhase::EXEC, result.stderr_data));
            }
            return HostResult<SSHResult>::Ok(std::move(result));
        };
        return run_session_action(transport, task, options, ctx, body);
    };

    PoolOptions pool{options.concurrency, options.timeout, options.cancel};
    return Batch::Ok(dispatch(tasks, pool, action, options.on_finished));
}

Result<BatchResult<SSHResult>> call(const std::vector<HostSpec>& hosts,
                                    const std::string& command, const Options& options) {
    return call(default_transport(), hosts, command, options);
}

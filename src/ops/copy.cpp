#include "copy.hpp"
#include "session_action.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <dispatch/dispatch.hpp>
#include <ssh/transport.hpp>
#include <fmt/format.h>
#include <filesystem>

Result<BatchResult<std::string>> copy(SSHTransport& transport, const std::vector<HostSpec>& hosts,
                                      const std::string& local_src, const std::string& remote_dst,
                                      const Options& options) {
    using Batch = Result<BatchResult<std::string>>;

    std::string problem = validate_hosts(hosts);
    if (problem.empty()) problem = validate_options(options);
    if (problem.empty()) {
        std::error_code ec;
        auto st = std::filesystem::status(local_src, ec);
        if (local_src.empty() || ec || !std::filesystem::exists(st)) {
            problem = "no such local file: " + local_src;
        } else if (std::filesystem::is_directory(st) && !options.recursive) {
            problem = local_src + " is a directory (use recursive)";
        }
    }
    if (!problem.empty()) {
        fanout_log("copy rejected: " + problem);
        return Batch::Err(problem);
    }

    auto tasks = make_tasks(hosts, ActionKind::COPY);
    fanout_log(fmt::format("copy: {} hosts, par {}, {} -> {}",
                           tasks.size(), options.concurrency, local_src, remote_dst));

    TransferFlags flags;
    flags.recursive = options.recursive;
    flags.create_dirs = options.create_dirs;

    HostAction<std::string> action = [&](const Task& task, TaskContext& ctx) {
        SessionBody<std::string> body = [&](RemoteSession& session) {
            std::string dest = expand_host_template(remote_dst, task.host.host);
            std::string written;
            SSHStatus status = session.put(local_src, dest, flags, written);
            if (!status.ok()) {
                return HostResult<std::string>::Err(make_error(task, status, SessionPhase::TRANSFER));
            }
            return HostResult<std::string>::Ok(written);
        };
        return run_session_action(transport, task, options, ctx, body);
    };

    PoolOptions pool{options.concurrency, options.timeout, options.cancel};
    return Batch::Ok(dispatch(tasks, pool, action, options.on_finished));
}

Result<BatchResult<std::string>> copy(const std::vector<HostSpec>& hosts,
                                      const std::string& local_src, const std::string& remote_dst,
                                      const Options& options) {
    return copy(default_transport(), hosts, local_src, remote_dst, options);
}

#include "slurp.hpp"
#include "session_action.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <dispatch/dispatch.hpp>
#include <ssh/transport.hpp>
#include <fmt/format.h>
#include <filesystem>

namespace fs = std::filesystem;

static std::string remote_basename(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    auto slash = path.rfind('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    return (name == "/" || name == "." || name == "..") ? "" : name;
}

Result<BatchResult<std::string>> slurp(SSHTransport& transport, const std::vector<HostSpec>& hosts,
                                       const std::string& remote_src, const std::string& local_base,
                                       const Options& options) {
    using Batch = Result<BatchResult<std::string>>;

    std::string local_name = options.local_name.empty() ? remote_basename(remote_src)
                                                        : options.local_name;
    std::string problem = validate_hosts(hosts);
    if (problem.empty()) problem = validate_options(options);
    if (problem.empty() && remote_src.empty()) problem = "no remote source given";
    if (problem.empty() && local_base.empty()) problem = "no local directory given";
    if (problem.empty() && local_name.empty()) {
        problem = "cannot derive a local name from " + remote_src;
    }
    if (problem.empty()) {
        std::error_code ec;
        fs::create_directories(local_base, ec);
        if (ec || !fs::is_directory(local_base)) {
            problem = fmt::format("cannot create local directory {}: {}", local_base,
                                  ec ? ec.message() : "not a directory");
        }
    }
    if (!problem.empty()) {
        fanout_log("slurp rejected: " + problem);
        return Batch::Err(problem);
    }

    auto tasks = make_tasks(hosts, ActionKind::SLURP);
    fanout_log(fmt::format("slurp: {} hosts, par {}, {} -> {}/<host>/{}",
                           tasks.size(), options.concurrency, remote_src, local_base, local_name));

    TransferFlags flags;
    flags.recursive = options.recursive;
    flags.create_dirs = true;

    HostAction<std::string> action = [&](const Task& task, TaskContext& ctx) {
        // Created per host so one unwritable directory fails only its host.
        fs::path host_dir = fs::path(local_base) / task.key;
        std::error_code ec;
        fs::create_directories(host_dir, ec);
        if (ec) {
            return HostResult<std::string>::Err(HostError{
                task.key, ErrorKind::TRANSFER,
                fmt::format("Cannot create {}: {}", host_dir.string(), ec.message()), ""});
        }

        fs::path dest = host_dir / expand_host_template(local_name, task.host.host);
        SessionBody<std::string> body = [&](RemoteSession& session) {
            std::string written;
            SSHStatus status = session.get(remote_src, dest, flags, written);
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

Result<BatchResult<std::string>> slurp(const std::vector<HostSpec>& hosts,
                                       const std::string& remote_src, const std::string& local_base,
                                       const Options& options) {
    return slurp(default_transport(), hosts, remote_src, local_base, options);
}

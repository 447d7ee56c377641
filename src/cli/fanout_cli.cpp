#include "fanout_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ops/call.hpp>
#include <ops/copy.hpp>
#include <ops/slurp.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <ssh/transport.hpp>
#include <fmt/format.h>
#include <iostream>
#include <iterator>
#include <mutex>
#include <set>

// ── Argument parsing ─────────────────────────────────────────

static const std::set<char> VALUE_FLAGS{'H', 'h', 'l', 'p', 't', 'o', 'e', 'x'};

Result<CliArgs> parse_args(const std::vector<std::string>& args) {
    CliArgs out;
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg == "--help") { out.help = true; continue; }
        if (arg == "--version") { out.version = true; continue; }
        if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') break;

        char flag = arg[1];
        if (VALUE_FLAGS.count(flag)) {
            std::string value;
            if (arg.size() > 2) {
                value = arg.substr(2);
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                return Result<CliArgs>::Err(fmt::format("option -{} needs a value", flag));
            }

            switch (flag) {
            case 'H': out.host_strings.push_back(value); break;
            case 'h': out.host_files.push_back(value); break;
            case 'l': out.user = value; break;
            case 'p': {
                int par = safe_stoi(value, -1);
                if (par < 1) return Result<CliArgs>::Err("-p needs a positive number, got " + value);
                out.par = par;
                break;
            }
            case 't': {
                int timeout = safe_stoi(value, -1);
                if (timeout < 0) return Result<CliArgs>::Err("-t needs a number of seconds, got " + value);
                out.timeout = timeout;
                break;
            }
            case 'o': out.outdir = value; break;
            case 'e': out.errdir = value; break;
            case 'x': out.key = value; break;
            }
            continue;
        }

        // Boolean flags may be combined: -ivr
        for (size_t k = 1; k < arg.size(); ++k) {
            switch (arg[k]) {
            case 'i': out.inline_output = true; break;
            case 'I': out.send_stdin = true; break;
            case 'r': out.recursive = true; break;
            case 'A': out.ask_pass = true; break;
            case 'S': out.strict_host_keys = true; break;
            case 'v': out.verbose = true; break;
            default:
                return Result<CliArgs>::Err(fmt::format("unknown option -{}", arg[k]));
            }
        }
    }

    if (out.help || out.version) return Result<CliArgs>::Ok(out);

    if (i >= args.size()) return Result<CliArgs>::Err("no command given");
    out.command = args[i++];
    out.positional.assign(args.begin() + static_cast<long>(i), args.end());

    if (out.command == "call") {
        if (out.positional.empty()) return Result<CliArgs>::Err("call needs a command line");
    } else if (out.command == "copy") {
        if (out.positional.size() != 2) return Result<CliArgs>::Err("copy needs <local-src> <remote-dst>");
    } else if (out.command == "slurp") {
        if (out.positional.size() < 2 || out.positional.size() > 3) {
            return Result<CliArgs>::Err("slurp needs <remote-src> <local-base> [local-name]");
        }
    } else {
        return Result<CliArgs>::Err("unknown command: " + out.command);
    }
    return Result<CliArgs>::Ok(out);
}

void print_usage(std::ostream& out) {
    out << "Usage: fanout [options] call <command...>\n"
           "       fanout [options] copy <local-src> <remote-dst>\n"
           "       fanout [options] slurp <remote-src> <local-base> [local-name]\n"
           "\n"
           "Options:\n"
           "  -H HOST      host entry [user@]host[:port] (repeatable, space separated)\n"
           "  -h FILE      file of host entries (repeatable)\n"
           "  -l USER      default user\n"
           "  -p PAR       max parallel sessions (default 32)\n"
           "  -t SECONDS   per-host timeout, 0 for none (default 60)\n"
           "  -o DIR       write each host's stdout to DIR/<host>\n"
           "  -e DIR       write each host's stderr to DIR/<host>\n"
           "  -x KEY       identity file\n"
           "  -i           print output inline as each host finishes\n"
           "  -I           send local stdin to every command\n"
           "  -r           copy directories recursively\n"
           "  -A           ask for a password\n"
           "  -S           require host keys in known_hosts\n"
           "  -v           echo the debug log to stderr\n"
           "  --help       show this help\n"
           "  --version    show version\n";
}

// ── Exit status ──────────────────────────────────────────────

template <typename T>
static bool any_failed(const BatchResult<T>& results) {
    for (const auto& kv : results) {
        if (kv.second.is_err()) return true;
    }
    return false;
}

int batch_exit_code(const BatchResult<SSHResult>& results, bool interrupted) {
    if (interrupted) return EXIT_INTERRUPTED;
    if (any_failed(results)) return EXIT_HOST_FAILED;
    for (const auto& kv : results) {
        if (kv.second.value().exit_code != 0) return EXIT_NONZERO;
    }
    return EXIT_OK;
}

int batch_exit_code(const BatchResult<std::string>& results, bool interrupted) {
    if (interrupted) return EXIT_INTERRUPTED;
    return any_failed(results) ? EXIT_HOST_FAILED : EXIT_OK;
}

// ── FanoutCLI ────────────────────────────────────────────────

FanoutCLI::FanoutCLI()
    : transport_(default_transport()), out_(std::cout), err_(std::cerr),
      color_(platform::stdout_is_tty()) {
}

FanoutCLI::FanoutCLI(SSHTransport& transport, std::ostream& out, std::ostream& err)
    : transport_(transport), out_(out), err_(err), color_(false) {
}

Result<std::vector<HostSpec>> FanoutCLI::collect_hosts(const CliArgs& args, const Config& config) {
    using R = Result<std::vector<HostSpec>>;
    std::vector<HostSpec> hosts;

    for (const auto& s : args.host_strings) {
        auto parsed = parse_host_string(s);
        if (parsed.is_err()) return R::Err(parsed.error);
        hosts.insert(hosts.end(), parsed.value.begin(), parsed.value.end());
    }

    if (!args.host_files.empty()) {
        std::vector<fs::path> paths(args.host_files.begin(), args.host_files.end());
        auto parsed = read_host_files(paths, [this](const std::string& warning) {
            err_ << theme::fail(warning);
        });
        if (parsed.is_err()) return R::Err(parsed.error);
        hosts.insert(hosts.end(), parsed.value.begin(), parsed.value.end());
    }

    if (args.host_strings.empty() && args.host_files.empty()) {
        hosts = config.hosts();
    }
    if (hosts.empty()) {
        return R::Err("no hosts given (use -H, -h or FANOUT_HOSTS)");
    }
    return R::Ok(hosts);
}

Result<Options> FanoutCLI::build_options(const CliArgs& args, const Config& config) {
    Options options = options_from_config(config);
    if (args.user) options.user = *args.user;
    if (args.par) options.concurrency = *args.par;
    if (args.timeout) options.timeout = std::chrono::seconds(*args.timeout);
    if (args.outdir) options.outdir = *args.outdir;
    if (args.errdir) options.errdir = *args.errdir;
    if (args.key) options.key_path = expand_tilde(*args.key);
    if (args.strict_host_keys) options.strict_host_keys = true;
    options.recursive = args.recursive;

    if (args.ask_pass) {
        options.password = platform::read_password("Password: ");
    }
    if (args.send_stdin) {
        options.input.assign(std::istreambuf_iterator<char>(std::cin),
                             std::istreambuf_iterator<char>());
    }

    std::string problem = validate_options(options);
    if (!problem.empty()) return Result<Options>::Err(problem);
    return Result<Options>::Ok(options);
}

void FanoutCLI::print_progress(const ProgressEvent& event, bool inline_output) {
    std::string message;
    if (!event.ok) {
        message = event.error;
    } else if (event.output && event.output->exit_code != 0) {
        message = fmt::format("Exited with error code {}", event.output->exit_code);
    }

    std::string line = fmt::format("{} {} ", theme::progress(color_, event.n), now_clock());
    if (message.empty()) {
        line += theme::success(color_) + " " + event.host;
    } else {
        line += theme::failure(color_) + " " + event.host + " " + theme::red(color_, message);
    }
    out_ << line << "\n";

    if (inline_output && event.output) {
        out_ << event.output->stdout_data;
        if (!event.output->stderr_data.empty()) {
            out_ << theme::red(color_, "Stderr: ") << event.output->stderr_data;
        }
    }
    out_.flush();
}

int FanoutCLI::run(const std::vector<std::string>& argv) {
    auto parsed = parse_args(argv);
    if (parsed.is_err()) {
        err_ << theme::fail(parsed.error);
        print_usage(err_);
        return EXIT_USAGE;
    }
    CliArgs args = parsed.value;
    if (args.help) {
        print_usage(out_);
        return EXIT_OK;
    }
    if (args.version) {
        out_ << "fanout " << FANOUT_VERSION << "\n";
        return EXIT_OK;
    }

    auto config = Config::load();
    if (config.is_err()) {
        err_ << theme::fail(config.error);
        return EXIT_USAGE;
    }
    auto env = config.value.apply_env();
    if (env.is_err()) {
        err_ << theme::fail(env.error);
        return EXIT_USAGE;
    }

    if (!config.value.log_file().empty()) set_log_file(config.value.log_file());
    set_log_verbose(args.verbose || config.value.verbose());

    auto hosts = collect_hosts(args, config.value);
    if (hosts.is_err()) {
        err_ << theme::fail(hosts.error);
        return EXIT_USAGE;
    }
    auto options = build_options(args, config.value);
    if (options.is_err()) {
        err_ << theme::fail(options.error);
        return EXIT_USAGE;
    }

    bool inline_output = args.inline_output;
    options.value.on_finished = [this, inline_output](const ProgressEvent& event) {
        print_progress(event, inline_output);
    };

    // Ctrl-C cancels the batch; a second Ctrl-C has nothing left to cancel.
    CancelToken cancel = options.value.cancel;
    platform::on_interrupt([cancel]() mutable {
        fanout_log("interrupted, cancelling batch");
        cancel.cancel();
    });

    int code;
    if (args.command == "call") {
        code = run_call(args, hosts.value, options.value);
    } else if (args.command == "copy") {
        code = run_copy(args, hosts.value, options.value);
    } else {
        code = run_slurp(args, hosts.value, options.value);
    }

    platform::remove_interrupt();
    return code;
}

int FanoutCLI::run_call(const CliArgs& args, const std::vector<HostSpec>& hosts, Options& options) {
    std::string command;
    for (const auto& part : args.positional) {
        if (!command.empty()) command += " ";
        command += part;
    }

    auto results = call(transport_, hosts, command, options);
    if (results.is_err()) {
        err_ << theme::fail(results.error);
        return EXIT_USAGE;
    }
    return batch_exit_code(results.value, options.cancel.cancelled());
}

int FanoutCLI::run_copy(const CliArgs& args, const std::vector<HostSpec>& hosts, Options& options) {
    auto results = copy(transport_, hosts, args.positional[0], args.positional[1], options);
    if (results.is_err()) {
        err_ << theme::fail(results.error);
        return EXIT_USAGE;
    }
    return batch_exit_code(results.value, options.cancel.cancelled());
}

int FanoutCLI::run_slurp(const CliArgs& args, const std::vector<HostSpec>& hosts, Options& options) {
    if (args.positional.size() > 2) options.local_name = args.positional[2];

    auto results = slurp(transport_, hosts, args.positional[0], args.positional[1], options);
    if (results.is_err()) {
        err_ << theme::fail(results.error);
        return EXIT_USAGE;
    }
    return batch_exit_code(results.value, options.cancel.cancelled());
}

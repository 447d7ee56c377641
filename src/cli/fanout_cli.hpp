#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/host.hpp>
#include <core/types.hpp>
#include <dispatch/aggregator.hpp>
#include <dispatch/host_result.hpp>
#include <ops/options.hpp>
#include <ssh/remote.hpp>

// Process exit status of the command-line tool
enum CliExit {
    EXIT_OK          = 0,   // every host succeeded (and exited 0)
    EXIT_USAGE       = 1,   // bad arguments or options
    EXIT_HOST_FAILED = 3,   // at least one host failed
    EXIT_NONZERO     = 4,   // no failures, but a command exited non-zero
    EXIT_INTERRUPTED = 5,   // batch cancelled by Ctrl-C
};

struct CliArgs {
    std::string command;                    // call | copy | slurp
    std::vector<std::string> positional;    // everything after the command
    std::vector<std::string> host_strings;  // -H
    std::vector<std::string> host_files;    // -h
    std::optional<std::string> user;        // -l
    std::optional<int> par;                 // -p
    std::optional<int> timeout;             // -t, seconds
    std::optional<std::string> outdir;      // -o
    std::optional<std::string> errdir;      // -e
    std::optional<std::string> key;         // -x
    bool inline_output = false;             // -i
    bool send_stdin = false;                // -I
    bool recursive = false;                 // -r
    bool ask_pass = false;                  // -A
    bool strict_host_keys = false;          // -S
    bool verbose = false;                   // -v
    bool help = false;
    bool version = false;
};

// Parse arguments (program name excluded). Flags must precede the command;
// everything after it belongs to the command.
Result<CliArgs> parse_args(const std::vector<std::string>& args);

int batch_exit_code(const BatchResult<SSHResult>& results, bool interrupted);
int batch_exit_code(const BatchResult<std::string>& results, bool interrupted);

void print_usage(std::ostream& out);

class FanoutCLI {
public:
    FanoutCLI();
    FanoutCLI(SSHTransport& transport, std::ostream& out, std::ostream& err);

    int run(const std::vector<std::string>& args);

private:
    SSHTransport& transport_;
    std::ostream& out_;
    std::ostream& err_;
    bool color_;

    Result<std::vector<HostSpec>> collect_hosts(const CliArgs& args, const Config& config);
    Result<Options> build_options(const CliArgs& args, const Config& config);
    void print_progress(const ProgressEvent& event, bool inline_output);

    int run_call(const CliArgs& args, const std::vector<HostSpec>& hosts, Options& options);
    int run_copy(const CliArgs& args, const std::vector<HostSpec>& hosts, Options& options);
    int run_slurp(const CliArgs& args, const std::vector<HostSpec>& hosts, Options& options);
};

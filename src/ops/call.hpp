#pragma once

#include <string>
#include <vector>
#include <core/host.hpp>
#include <core/types.hpp>
#include <dispatch/host_result.hpp>
#include <ssh/remote.hpp>
#include "options.hpp"

// Run command on every host. Each successful entry carries the exit status
// and, in BUFFERED mode, the complete stdout and stderr. A non-zero exit
// status is still a success entry. Fails upfront only for invalid input.
Result<BatchResult<SSHResult>> call(SSHTransport& transport, const std::vector<HostSpec>& hosts,
                                    const std::string& command, const Options& options);

Result<BatchResult<SSHResult>> call(const std::vector<HostSpec>& hosts,
                                    const std::string& command, const Options& options);

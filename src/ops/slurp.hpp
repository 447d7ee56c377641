#pragma once

#include <string>
#include <vector>
#include <core/host.hpp>
#include <core/types.hpp>
#include <dispatch/host_result.hpp>
#include <ssh/remote.hpp>
#include "options.hpp"

// Pull remote_src from every host into local_base/<host key>/<local name>.
// The local name is Options::local_name ("{host}" expanded) or the remote
// basename. Each successful entry is the local path written.
Result<BatchResult<std::string>> slurp(SSHTransport& transport, const std::vector<HostSpec>& hosts,
                                       const std::string& remote_src, const std::string& local_base,
                                       const Options& options);

Result<BatchResult<std::string>> slurp(const std::vector<HostSpec>& hosts,
                                       const std::string& remote_src, const std::string& local_base,
                                       const Options& options);

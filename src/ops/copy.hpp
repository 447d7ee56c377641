#pragma once

#include <string>
#include <vector>
#include <core/host.hpp>
#include <core/types.hpp>
#include <dispatch/host_result.hpp>
#include <ssh/remote.hpp>
#include "options.hpp"

// Push local_src to remote_dst on every host. "{host}" in remote_dst is
// replaced per host. Each successful entry is the remote path written,
// which is remote_dst/<name> when remote_dst is an existing directory.
Result<BatchResult<std::string>> copy(SSHTransport& transport, const std::vector<HostSpec>& hosts,
                                      const std::string& local_src, const std::string& remote_dst,
                                      const Options& options);

Result<BatchResult<std::string>> copy(const std::vector<HostSpec>& hosts,
                                      const std::string& local_src, const std::string& remote_dst,
                                      const Options& options);

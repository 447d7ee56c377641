#include "session.hpp"
#include <core/log.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <fstream>
#include <vector>

static std::string remote_basename(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

static std::string remote_join(const std::string& dir, const std::string& name) {
    if (dir.empty() || dir == ".") return name;
    return dir.back() == '/' ? dir + name : dir + "/" + name;
}

static std::string remote_parent(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return "";
    return slash == 0 ? "/" : path.substr(0, slash);
}

static const char* sftp_code_text(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:         return "No such file or directory";
    case LIBSSH2_FX_PERMISSION_DENIED:    return "Permission denied";
    case LIBSSH2_FX_FAILURE:              return "Failure";
    case LIBSSH2_FX_NO_SUCH_PATH:         return "No such path";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:  return "File already exists";
    case LIBSSH2_FX_WRITE_PROTECT:        return "Write protected";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
    case LIBSSH2_FX_QUOTA_EXCEEDED:       return "No space left";
    case LIBSSH2_FX_NOT_A_DIRECTORY:      return "Not a directory";
    default:                              return "SFTP error";
    }
}

// ── SFTP plumbing ────────────────────────────────────────────

SSHStatus Libssh2Session::start_sftp() {
    if (sftp_) return SSHStatus::Ok();
    if (!session_) return fail(SSHErrc::CHANNEL_ERROR, "No session available for SFTP");

    while ((sftp_ = libssh2_sftp_init(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return fail(SSHErrc::CHANNEL_ERROR, "Failed to start SFTP subsystem: " + last_error());
        }
        if (!wait_socket()) return fail(SSHErrc::ABORTED, "aborted starting SFTP");
    }
    return SSHStatus::Ok();
}

SSHStatus Libssh2Session::sftp_error(const std::string& what, const std::string& path) const {
    if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long code = libssh2_sftp_last_error(sftp_);
        return fail(SSHErrc::REMOTE_IO, fmt::format("{} {}: {}", what, path, sftp_code_text(code)));
    }
    return fail(SSHErrc::REMOTE_IO, fmt::format("{} {}: {}", what, path, last_error()));
}

SSHStatus Libssh2Session::remote_stat(const std::string& path, LIBSSH2_SFTP_ATTRIBUTES& attrs,
                                      bool& exists) {
    exists = false;
    int rc;
    while ((rc = libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                      LIBSSH2_SFTP_STAT, &attrs)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) return fail(SSHErrc::ABORTED, "aborted");
    }
    if (rc == 0) {
        exists = true;
        return SSHStatus::Ok();
    }
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long code = libssh2_sftp_last_error(sftp_);
        if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) {
            return SSHStatus::Ok();
        }
    }
    return sftp_error("Cannot stat", path);
}

SSHStatus Libssh2Session::remote_mkdir(const std::string& path) {
    int rc;
    while ((rc = libssh2_sftp_mkdir_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                       0755)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) return fail(SSHErrc::ABORTED, "aborted");
    }
    if (rc == 0) return SSHStatus::Ok();

    // Servers report an existing directory as a generic failure.
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    bool exists = false;
    auto status = remote_stat(path, attrs, exists);
    if (status.ok() && exists && LIBSSH2_SFTP_S_ISDIR(attrs.permissions)) {
        return SSHStatus::Ok();
    }
    return fail(SSHErrc::REMOTE_IO, "Cannot create directory " + path);
}

SSHStatus Libssh2Session::remote_mkdir_p(const std::string& path) {
    if (path.empty() || path == "/" || path == ".") return SSHStatus::Ok();

    std::string prefix = path[0] == '/' ? "/" : "";
    size_t pos = 0;
    while (pos < path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        std::string part = path.substr(pos, next - pos);
        pos = next + 1;
        if (part.empty() || part == ".") continue;

        prefix = remote_join(prefix.empty() ? "." : prefix, part);
        auto status = remote_mkdir(prefix);
        if (!status.ok()) return status;
    }
    return SSHStatus::Ok();
}

// ── Upload ───────────────────────────────────────────────────

SSHStatus Libssh2Session::put(const fs::path& local, const std::string& remote,
                              const TransferFlags& flags, std::string& written) {
    written.clear();
    std::error_code ec;
    auto st = fs::status(local, ec);
    if (ec || !fs::exists(st)) {
        return fail(SSHErrc::LOCAL_IO, "No such local file: " + local.string());
    }
    bool is_dir = fs::is_directory(st);
    if (is_dir && !flags.recursive) {
        return fail(SSHErrc::LOCAL_IO, local.string() + " is a directory (use recursive)");
    }

    auto status = start_sftp();
    if (!status.ok()) return status;

    std::string dest = remote.empty() ? "." : remote;
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    bool exists = false;
    status = remote_stat(dest, attrs, exists);
    if (!status.ok()) return status;

    std::string target = dest;
    if (exists && LIBSSH2_SFTP_S_ISDIR(attrs.permissions)) {
        target = remote_join(dest, local.filename().string());
    } else if (flags.create_dirs) {
        status = remote_mkdir_p(remote_parent(dest));
        if (!status.ok()) return status;
    }

    status = is_dir ? put_tree(local, target) : put_file(local, target);
    if (status.ok()) written = target;
    return status;
}

SSHStatus Libssh2Session::put_file(const fs::path& local, const std::string& remote) {
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return fail(SSHErrc::LOCAL_IO, "Cannot read local file " + local.string());
    }
    std::error_code ec;
    auto local_size = fs::file_size(local, ec);
    auto perms = fs::status(local, ec).permissions();
    long mode = ec ? 0644 : (static_cast<long>(perms) & 0777);

    LIBSSH2_SFTP_HANDLE* handle = nullptr;
    while ((handle = libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned int>(remote.size()),
                                          LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                          mode, LIBSSH2_SFTP_OPENFILE)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return sftp_error("Cannot open remote file", remote);
        }
        if (!wait_socket()) return fail(SSHErrc::ABORTED, "aborted");
    }

    SSHStatus status = SSHStatus::Ok();
    std::vector<char> buf(SFTP_CHUNK_SIZE);
    uint64_t sent_total = 0;
    while (status.ok()) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = static_cast<size_t>(in.gcount());
        if (got == 0) {
            if (in.bad()) status = fail(SSHErrc::LOCAL_IO, "Read error on " + local.string());
            break;
        }
        size_t off = 0;
        while (off < got) {
            ssize_t w = libssh2_sftp_write(handle, buf.data() + off, got - off);
            if (w == LIBSSH2_ERROR_EAGAIN) {
                if (!wait_socket()) {
                    status = fail(SSHErrc::ABORTED, "aborted");
                    break;
                }
                continue;
            }
            if (w < 0) {
                status = sftp_error("Write failed on", remote);
                break;
            }
            off += static_cast<size_t>(w);
            sent_total += static_cast<uint64_t>(w);
        }
    }

    while (libssh2_sftp_close_handle(handle) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) break;
    }
    if (!status.ok()) return status;

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    bool exists = false;
    status = remote_stat(remote, attrs, exists);
    if (!status.ok()) return status;
    uint64_t remote_size = (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) ? attrs.filesize : sent_total;
    if (!exists || remote_size != local_size || sent_total != local_size) {
        return fail(SSHErrc::SIZE_MISMATCH,
                    fmt::format("{}: wrote {} bytes, remote has {}, expected {}",
                                remote, sent_total, exists ? remote_size : 0, local_size));
    }
    return SSHStatus::Ok();
}

SSHStatus Libssh2Session::put_tree(const fs::path& local, const std::string& remote) {
    auto status = remote_mkdir(remote);
    if (!status.ok()) return status;

    std::error_code ec;
    for (fs::directory_iterator it(local, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::string child = remote_join(remote, entry.path().filename().string());
        if (entry.is_directory(ec)) {
            status = put_tree(entry.path(), child);
        } else if (entry.is_regular_file(ec)) {
            status = put_file(entry.path(), child);
        } else {
            fanout_log(fmt::format("{}: skipping special file {}", label_, entry.path().string()));
            continue;
        }
        if (!status.ok()) return status;
    }
    if (ec) {
        return fail(SSHErrc::LOCAL_IO, fmt::format("Cannot list {}: {}", local.string(), ec.message()));
    }
    return SSHStatus::Ok();
}

// ── Download ─────────────────────────────────────────────────

SSHStatus Libssh2Session::get(const std::string& remote, const fs::path& local,
                              const TransferFlags& flags, std::string& written) {
    written.clear();
    auto status = start_sftp();
    if (!status.ok()) return status;

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    bool exists = false;
    status = remote_stat(remote, attrs, exists);
    if (!status.ok()) return status;
    if (!exists) {
        return fail(SSHErrc::REMOTE_IO, "No such remote file: " + remote);
    }
    bool is_dir = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
    if (is_dir && !flags.recursive) {
        return fail(SSHErrc::REMOTE_IO, remote + " is a directory (use recursive)");
    }

    std::error_code ec;
    fs::path target = local;
    if (fs::is_directory(local, ec)) {
        target = local / remote_basename(remote);
    } else if (flags.create_dirs && target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return fail(SSHErrc::LOCAL_IO,
                        fmt::format("Cannot create {}: {}", target.parent_path().string(), ec.message()));
        }
    }

    status = is_dir ? get_tree(remote, target) : get_file(remote, target);
    if (status.ok()) written = target.string();
    return status;
}

SSHStatus Libssh2Session::get_file(const std::string& remote, const fs::path& local) {
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    bool exists = false;
    auto status = remote_stat(remote, attrs, exists);
    if (!status.ok()) return status;
    if (!exists) return fail(SSHErrc::REMOTE_IO, "No such remote file: " + remote);

    LIBSSH2_SFTP_HANDLE* handle = nullptr;
    while ((handle = libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned int>(remote.size()),
                                          LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return sftp_error("Cannot open remote file", remote);
        }
        if (!wait_socket()) return fail(SSHErrc::ABORTED, "aborted");
    }

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        while (libssh2_sftp_close_handle(handle) == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_socket()) break;
        }
        return fail(SSHErrc::LOCAL_IO, "Cannot write local file " + local.string());
    }

    std::vector<char> buf(SFTP_CHUNK_SIZE);
    uint64_t received = 0;
    while (true) {
        ssize_t n = libssh2_sftp_read(handle, buf.data(), buf.size());
        if (n == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_socket()) {
                status = fail(SSHErrc::ABORTED, "aborted");
                break;
            }
            continue;
        }
        if (n < 0) {
            status = sftp_error("Read failed on", remote);
            break;
        }
        if (n == 0) break;
        out.write(buf.data(), n);
        if (!out) {
            status = fail(SSHErrc::LOCAL_IO, "Write error on " + local.string());
            break;
        }
        received += static_cast<uint64_t>(n);
    }

    while (libssh2_sftp_close_handle(handle) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) break;
    }
    out.close();
    if (!status.ok()) return status;

    if ((attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) && received != attrs.filesize) {
        return fail(SSHErrc::SIZE_MISMATCH,
                    fmt::format("{}: received {} bytes, expected {}", remote, received, attrs.filesize));
    }
    if ((attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)) {
        std::error_code ec;
        fs::permissions(local, static_cast<fs::perms>(attrs.permissions & 0777), ec);
    }
    return SSHStatus::Ok();
}

SSHStatus Libssh2Session::get_tree(const std::string& remote, const fs::path& local) {
    std::error_code ec;
    fs::create_directories(local, ec);
    if (ec) {
        return fail(SSHErrc::LOCAL_IO, fmt::format("Cannot create {}: {}", local.string(), ec.message()));
    }

    LIBSSH2_SFTP_HANDLE* dir = nullptr;
    while ((dir = libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned int>(remote.size()),
                                       0, 0, LIBSSH2_SFTP_OPENDIR)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return sftp_error("Cannot open remote directory", remote);
        }
        if (!wait_socket()) return fail(SSHErrc::ABORTED, "aborted");
    }

    // Collect entries first; the directory handle stays open only for listing.
    std::vector<std::pair<std::string, bool>> entries;
    SSHStatus status = SSHStatus::Ok();
    char name[512];
    char longentry[512];
    while (true) {
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        int rc = libssh2_sftp_readdir_ex(dir, name, sizeof(name), longentry, sizeof(longentry), &attrs);
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_socket()) {
                status = fail(SSHErrc::ABORTED, "aborted");
                break;
            }
            continue;
        }
        if (rc < 0) {
            status = sftp_error("Cannot list", remote);
            break;
        }
        if (rc == 0) break;

        std::string entry(name, static_cast<size_t>(rc));
        if (entry == "." || entry == "..") continue;
        if (LIBSSH2_SFTP_S_ISDIR(attrs.permissions)) {
            entries.emplace_back(entry, true);
        } else if (LIBSSH2_SFTP_S_ISREG(attrs.permissions)) {
            entries.emplace_back(entry, false);
        } else {
            fanout_log(fmt::format("{}: skipping special file {}", label_, remote_join(remote, entry)));
        }
    }
    while (libssh2_sftp_close_handle(dir) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) break;
    }
    if (!status.ok()) return status;

    for (const auto& entry : entries) {
        std::string child = remote_join(remote, entry.first);
        status = entry.second ? get_tree(child, local / entry.first)
                              : get_file(child, local / entry.first);
        if (!status.ok()) return status;
    }
    return SSHStatus::Ok();
}

#include "session.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>
#include <vector>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round = 0;
};

// libssh2 keyboard-interactive callback. Every prompt is answered with the
// password; servers that want more than that reject the attempt.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    if (!data || data->prompt_round++ > 2) return;

    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

static bool offers(const std::string& methods, const char* method) {
    return methods.empty() || methods.find(method) != std::string::npos;
}

SSHStatus Libssh2Session::authenticate() {
    const std::string& user = target_.user;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (!wait_socket()) return fail(SSHErrc::ABORTED, "aborted during authentication");
    }

    // Servers configured with "none" auth accept us at the list request.
    if (!auth_list && libssh2_userauth_authenticated(session_)) {
        fanout_log(fmt::format("{}: authenticated (none)", label_));
        return SSHStatus::Ok();
    }

    std::string methods = auth_list ? auth_list : "";
    fanout_log(fmt::format("{}: auth methods: {}", label_, methods.empty() ? "(unknown)" : methods));

    if (target_.use_agent && offers(methods, "publickey")) {
        if (auth_agent()) return SSHStatus::Ok();
        if (aborted_) return fail(SSHErrc::ABORTED, "aborted during authentication");
    }

    if (offers(methods, "publickey")) {
        std::vector<std::string> keys;
        if (target_.key_path) {
            keys.push_back(expand_tilde(*target_.key_path));
        } else {
            auto ssh_dir = platform::home_dir() / ".ssh";
            for (const char* name : {"id_ed25519", "id_ecdsa", "id_rsa"}) {
                auto candidate = ssh_dir / name;
                std::error_code ec;
                if (fs::exists(candidate, ec)) keys.push_back(candidate.string());
            }
        }
        for (const auto& key : keys) {
            if (auth_key_file(key)) return SSHStatus::Ok();
            if (aborted_) return fail(SSHErrc::ABORTED, "aborted during authentication");
        }
    }

    if (target_.password) {
        if (offers(methods, "password") && auth_password()) return SSHStatus::Ok();
        if (aborted_) return fail(SSHErrc::ABORTED, "aborted during authentication");

        if (offers(methods, "keyboard-interactive") && auth_keyboard_interactive()) {
            return SSHStatus::Ok();
        }
        if (aborted_) return fail(SSHErrc::ABORTED, "aborted during authentication");
    }

    return fail(SSHErrc::AUTH_REJECTED,
                fmt::format("Authentication failed for {} (methods offered: {})",
                            user, methods.empty() ? "unknown" : methods));
}

bool Libssh2Session::auth_agent() {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) return false;

    bool ok = false;
    if (libssh2_agent_connect(agent) == 0) {
        if (libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            while (!ok && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                int rc;
                while ((rc = libssh2_agent_userauth(agent, target_.user.c_str(), identity))
                       == LIBSSH2_ERROR_EAGAIN) {
                    if (!wait_socket()) break;
                }
                if (rc == 0) {
                    fanout_log(fmt::format("{}: authenticated with agent key {}",
                                           label_, identity->comment ? identity->comment : "?"));
                    ok = true;
                }
                if (aborted_) break;
                prev = identity;
            }
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    return ok;
}

bool Libssh2Session::auth_key_file(const std::string& private_key) {
    std::string public_key = private_key + ".pub";
    std::error_code ec;
    bool has_pub = fs::exists(public_key, ec);
    const char* passphrase = target_.password ? target_.password->c_str() : nullptr;

    int rc;
    while ((rc = libssh2_userauth_publickey_fromfile_ex(
                session_, target_.user.c_str(), static_cast<unsigned int>(target_.user.length()),
                has_pub ? public_key.c_str() : nullptr,
                private_key.c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) return false;
    }
    if (rc != 0) {
        fanout_log(fmt::format("{}: key {} rejected: {}", label_, private_key, last_error()));
        return false;
    }
    fanout_log(fmt::format("{}: authenticated with key {}", label_, private_key));
    return true;
}

bool Libssh2Session::auth_password() {
    int rc;
    while ((rc = libssh2_userauth_password(session_, target_.user.c_str(),
                                           target_.password->c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) return false;
    }
    if (rc != 0) return false;
    fanout_log(fmt::format("{}: authenticated with password", label_));
    return true;
}

bool Libssh2Session::auth_keyboard_interactive() {
    KbdAuthData kbd_data;
    kbd_data.password = *target_.password;

    void** abstract = libssh2_session_abstract(session_);
    *abstract = &kbd_data;

    int rc;
    while ((rc = libssh2_userauth_keyboard_interactive(session_, target_.user.c_str(),
                                                       kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) break;
    }
    *abstract = nullptr;

    if (rc != 0) return false;
    fanout_log(fmt::format("{}: authenticated with keyboard-interactive", label_));
    return true;
}

#include "auth.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <libssh2.h>
#include <cstring>
#include <cstdlib>

// Data passed to the keyboard-interactive callback via the session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
    StatusCallback callback;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        nimbus_log("kbd-interactive prompt: " + prompt_text);
        if (data->callback && data->prompt_round == 0) data->callback("Sending password...");
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

static bool has_method(const std::string& methods, const char* name) {
    // An empty list means the server did not say; try everything.
    return methods.empty() || methods.find(name) != std::string::npos;
}

static bool try_agent(LIBSSH2_SESSION* session, const std::string& user,
                      StatusCallback callback) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session);
    if (!agent) return false;

    bool ok = false;
    if (libssh2_agent_connect(agent) == 0) {
        if (libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                if (libssh2_agent_userauth(agent, user.c_str(), identity) == 0) {
                    if (callback) callback("Authenticated with ssh-agent");
                    ok = true;
                    break;
                }
                prev = identity;
            }
        }
        libssh2_agent_disconnect(agent);
    } else {
        nimbus_log("ssh-agent not reachable");
    }
    libssh2_agent_free(agent);
    return ok;
}

static bool try_key_file(LIBSSH2_SESSION* session, const std::string& user,
                         const std::string& key_path) {
    int rc = libssh2_userauth_publickey_fromfile_ex(
        session, user.c_str(), static_cast<unsigned int>(user.length()),
        nullptr, key_path.c_str(), "");
    if (rc != 0) {
        nimbus_log("Key " + key_path + " rejected (rc=" + std::to_string(rc) + ")");
    }
    return rc == 0;
}

std::vector<std::string> candidate_key_files(const SessionTarget& target) {
    std::vector<std::string> keys;
    if (target.ssh_key_path && !target.ssh_key_path->empty()) {
        keys.push_back(*target.ssh_key_path);
    }
    auto ssh_dir = platform::home_dir() / ".ssh";
    for (const char* name : {"id_ed25519", "id_rsa"}) {
        auto path = (ssh_dir / name).string();
        if (platform::is_readable(path) &&
            (keys.empty() || keys.front() != path)) {
            keys.push_back(path);
        }
    }
    return keys;
}

SSHResult authenticate(LIBSSH2_SESSION* session, const SessionTarget& target,
                       StatusCallback callback) {
    const std::string& user = target.user;

    // Check what auth methods the server supports
    char* auth_list = libssh2_userauth_list(session, user.c_str(),
                                            static_cast<unsigned int>(user.length()));
    if (!auth_list && libssh2_userauth_authenticated(session)) {
        return SSHResult{0, "", ""};    // server accepted "none"
    }
    std::string methods = auth_list ? auth_list : "";
    nimbus_log("Auth methods for " + user + "@" + target.host + ": " + methods);

    if (has_method(methods, "publickey")) {
        if (try_agent(session, user, callback)) return SSHResult{0, "", ""};

        for (const auto& key : candidate_key_files(target)) {
            if (callback) callback("Trying key " + key + "...");
            if (try_key_file(session, user, key)) {
                if (callback) callback("Authenticated with " + key);
                return SSHResult{0, "", ""};
            }
        }
    }

    bool want_password = has_method(methods, "password");
    bool want_kbd = has_method(methods, "keyboard-interactive");
    if (!want_password && !want_kbd) {
        return SSHResult{-1, "", "No supported authentication method (server offers: " + methods + ")"};
    }

    std::string password = target.password;
    if (password.empty()) {
        if (!platform::stdin_is_tty()) {
            return SSHResult{-1, "", "Authentication failed: no usable key and no terminal to prompt for a password"};
        }
        password = platform::read_secret(user + "@" + target.host + "'s password: ");
    }

    if (want_password) {
        if (callback) callback("Using password auth...");
        int rc = libssh2_userauth_password(session, user.c_str(), password.c_str());
        if (rc == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
        nimbus_log("Password auth rejected (rc=" + std::to_string(rc) + ")");
    }

    if (want_kbd) {
        if (callback) callback("Using keyboard-interactive auth...");
        KbdAuthData kbd_data{password, 0, callback};
        *libssh2_session_abstract(session) = &kbd_data;
        int rc = libssh2_userauth_keyboard_interactive(session, user.c_str(), kbd_callback);
        *libssh2_session_abstract(session) = nullptr;
        if (rc == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed for " + user + "@" + target.host};
}

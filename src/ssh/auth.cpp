#include "auth.hpp"
#include <core/credentials.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fstream>

static bool readable(const std::string& path) {
    std::ifstream f(path);
    return static_cast<bool>(f);
}

std::vector<std::string> default_key_paths() {
    auto ssh_dir = platform::home_dir() / ".ssh";
    return {
        (ssh_dir / "id_ed25519").string(),
        (ssh_dir / "id_ecdsa").string(),
        (ssh_dir / "id_rsa").string(),
    };
}

Result<AuthMaterial> build_auth(const AuthConfig& config, CredentialManager& creds) {
    AuthMaterial auth;

    auth.user = config.user.empty() ? get_local_username() : config.user;
    if (auth.user.empty()) {
        return Result<AuthMaterial>::Err("No SSH user configured and $USER is not set");
    }

    if (!config.private_key.empty()) {
        std::string key = expand_home(config.private_key);
        if (!readable(key)) {
            return Result<AuthMaterial>::Err("Cannot read private key: " + key);
        }
        auth.private_key = key;
    } else {
        for (const auto& key : default_key_paths()) {
            if (readable(key)) {
                auth.private_key = key;
                break;
            }
        }
    }

    auth.password = config.password;
    if (auth.password.empty()) {
        auto stored = creds.get("password");
        if (stored.is_ok()) auth.password = stored.value;
    }

    auth.passphrase = config.passphrase;
    if (auth.passphrase.empty() && auth.has_key()) {
        auto stored = creds.get("passphrase");
        if (stored.is_ok()) auth.passphrase = stored.value;
    }

    if (!auth.has_key() && !auth.has_password()) {
        return Result<AuthMaterial>::Err(
            "No SSH credentials: set auth.private_key or auth.password, "
            "or store a password with 'fleetcmd credentials set password'");
    }

    return Result<AuthMaterial>::Ok(auth);
}

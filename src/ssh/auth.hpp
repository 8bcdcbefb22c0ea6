#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

class CredentialManager;

// Everything a dial needs to authenticate. Built once per run.
struct AuthMaterial {
    std::string user;
    std::string private_key;   // path; empty when only password auth is possible
    std::string passphrase;
    std::string password;

    bool has_key() const { return !private_key.empty(); }
    bool has_password() const { return !password.empty(); }
};

// Resolve auth settings into usable material:
//   user        config, else $USER
//   private_key config (must be readable), else first readable default key
//   password    config, else credential store "password"
//   passphrase  config, else credential store "passphrase"
// Fails when an explicit key is unreadable, or when neither a key nor a
// password is available.
Result<AuthMaterial> build_auth(const AuthConfig& config, CredentialManager& creds);

// ~/.ssh/id_ed25519, ~/.ssh/id_ecdsa, ~/.ssh/id_rsa
std::vector<std::string> default_key_paths();

#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include "types.hpp"

struct CredentialInfo {
    std::string key;
    bool has_value;
};

// Secrets stored as key=value lines in ~/.fleetcmd/credentials (chmod 600).
class CredentialManager {
public:
    static CredentialManager& instance();

    explicit CredentialManager(std::filesystem::path path);

    // Get credential by key
    Result<std::string> get(const std::string& key);

    // Set credential
    Result<void> set(const std::string& key, const std::string& value);

    // Remove credential
    Result<void> remove(const std::string& key);

    // List all stored credentials
    std::vector<CredentialInfo> list();

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;

    std::map<std::string, std::string> read_all() const;
    bool write_all(const std::map<std::string, std::string>& m) const;
};

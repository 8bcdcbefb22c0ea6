#include "credentials.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

CredentialManager& CredentialManager::instance() {
    static CredentialManager mgr(platform::home_dir() / FLEETCMD_DIR_NAME / CREDENTIALS_FILE_NAME);
    return mgr;
}

CredentialManager::CredentialManager(fs::path path)
    : path_(std::move(path)) {
}

std::map<std::string, std::string> CredentialManager::read_all() const {
    std::map<std::string, std::string> m;
    std::ifstream f(path_);
    if (!f) return m;

    std::string line;
    while (std::getline(f, line)) {
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

bool CredentialManager::write_all(const std::map<std::string, std::string>& m) const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);

    std::ofstream f(path_, std::ios::trunc);
    if (!f) return false;

    for (const auto& [k, v] : m) {
        f << k << "=" << v << "\n";
    }
    f.close();

    chmod(path_.c_str(), 0600);
    return true;
}

Result<std::string> CredentialManager::get(const std::string& key) {
    auto m = read_all();
    auto it = m.find(key);
    if (it == m.end()) {
        return Result<std::string>::Err("Credential not found: " + key);
    }
    return Result<std::string>::Ok(it->second);
}

Result<void> CredentialManager::set(const std::string& key, const std::string& value) {
    auto m = read_all();
    m[key] = value;
    if (!write_all(m)) {
        return Result<void>::Err("Failed to write credentials file");
    }
    return Result<void>::Ok();
}

Result<void> CredentialManager::remove(const std::string& key) {
    auto m = read_all();
    if (m.erase(key) == 0) {
        return Result<void>::Err("Credential not found: " + key);
    }
    if (!write_all(m)) {
        return Result<void>::Err("Failed to write credentials file");
    }
    return Result<void>::Ok();
}

std::vector<CredentialInfo> CredentialManager::list() {
    std::vector<CredentialInfo> infos;
    for (const auto& [k, v] : read_all()) {
        infos.push_back({k, !v.empty()});
    }
    return infos;
}

#include "utils.hpp"
#include <platform/platform.hpp>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

std::string get_local_username() {
    const char* user = std::getenv("USER");
    if (user && *user) return user;

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_name) return pw->pw_name;
    return "";
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

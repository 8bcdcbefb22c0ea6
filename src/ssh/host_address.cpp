#include "host_address.hpp"
#include <core/utils.hpp>
#include <algorithm>

std::string normalize_host(const std::string& host, int default_port) {
    std::string port = std::to_string(default_port);

    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        if (close != std::string::npos && close + 1 < host.size() && host[close + 1] == ':') {
            return host;
        }
        return host.substr(0, close == std::string::npos ? host.size() : close + 1) + ":" + port;
    }

    auto colons = std::count(host.begin(), host.end(), ':');
    if (colons == 0) return host + ":" + port;
    if (colons > 1) return "[" + host + "]:" + port;
    return host;
}

Result<HostPort> split_host_port(const std::string& address) {
    std::string host;
    std::string port;

    if (!address.empty() && address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string::npos) {
            return Result<HostPort>::Err("address " + address + ": missing ']'");
        }
        host = address.substr(1, close - 1);
        if (close + 1 >= address.size() || address[close + 1] != ':') {
            return Result<HostPort>::Err("address " + address + ": missing port");
        }
        port = address.substr(close + 2);
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string::npos) {
            return Result<HostPort>::Err("address " + address + ": missing port");
        }
        host = address.substr(0, colon);
        port = address.substr(colon + 1);
        if (host.find(':') != std::string::npos) {
            return Result<HostPort>::Err("address " + address + ": too many colons");
        }
    }

    int p = safe_stoi(port, -1);
    if (host.empty() || p <= 0 || p > 65535) {
        return Result<HostPort>::Err("address " + address + ": invalid host or port");
    }
    return Result<HostPort>::Ok(HostPort{host, p});
}

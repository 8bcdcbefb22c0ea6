#pragma once

#include <string>
#include <core/types.hpp>

struct HostPort {
    std::string host;
    int port;
};

// Append ":default_port" unless host already names a port.
//   "web1"         → "web1:22"
//   "web1:2222"    → "web1:2222"
//   "::1"          → "[::1]:22"    (bare IPv6 literal)
//   "[::1]:2222"   → "[::1]:2222"
std::string normalize_host(const std::string& host, int default_port);

// Split "host:port" / "[v6]:port" into its parts.
Result<HostPort> split_host_port(const std::string& address);

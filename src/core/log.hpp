#pragma once

#include <string>
#include "types.hpp"

// Debug log: <tmp>/fleetcmd_debug.log unless overridden by config log.path.
std::string fleet_log_path();
void set_fleet_log_path(const std::string& path);

// Append a "[HH:MM:SS.mmm] msg" line to the debug log. Safe to call from
// worker threads.
void fleet_log(const std::string& msg);

// Record a remote command and its result under a label (usually the host).
void fleet_log_ssh(const std::string& label, const std::string& cmd,
                   const SSHResult& r);

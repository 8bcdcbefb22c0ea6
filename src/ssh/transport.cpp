#include "transport.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

std::string exit_error(const SSHResult& r) {
    if (r.success()) return "";

    std::string msg = fmt::format("Process exited with status {}", r.exit_code);
    if (!r.exit_signal.empty()) {
        msg += fmt::format(" from signal {}", r.exit_signal);
    }

    std::string err = trim_trailing_newlines(r.stderr_data);
    if (!err.empty()) {
        msg += "\n" + err;
    }
    return msg;
}

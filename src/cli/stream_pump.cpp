#include "stream_pump.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fleet/remote_command.hpp>
#include <fmt/format.h>
#include <functional>
#include <system_error>

StreamPump::StreamPump(std::ostream& out, std::ostream& err, bool no_host)
    : out_(out), err_(err), no_host_(no_host) {
}

StreamPump::~StreamPump() {
    join();
}

void StreamPump::attach(const RemoteCommand& rc) {
    for (const auto& [host, readers] : rc.live_readers()) {
        try {
            if (readers.out) {
                threads_.emplace_back(&StreamPump::pump, this, host, readers.out, std::ref(out_));
            }
            if (readers.err) {
                threads_.emplace_back(&StreamPump::pump, this, host, readers.err, std::ref(err_));
            }
        } catch (const std::system_error& e) {
            fleet_log(fmt::format("{}: cannot start stream reader: {}", host, e.what()));
        }
    }
}

void StreamPump::join() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void StreamPump::pump(std::string host, std::shared_ptr<Reader> reader, std::ostream& dest) {
    std::string pending;
    char buf[SSH_READ_BUF_SIZE];

    while (true) {
        long n = reader->read(buf, sizeof(buf));
        if (n < 0) {
            fleet_log(fmt::format("{}: stream read error", host));
            break;
        }
        if (n == 0) break;

        pending.append(buf, static_cast<size_t>(n));
        size_t start = 0;
        size_t nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            write_line(host, pending.substr(start, nl - start), dest);
            start = nl + 1;
        }
        pending.erase(0, start);
    }

    if (!pending.empty()) {
        write_line(host, pending, dest);
    }
}

void StreamPump::write_line(const std::string& host, const std::string& line, std::ostream& dest) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!no_host_) {
        dest << fmt::format("{:>{}}: ", host, REPORT_HOST_WIDTH);
    }
    dest << line << "\n";
    dest.flush();
}

#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>
#include <ssh/transport.hpp>

class RemoteCommand;

// Copies the live stdout/stderr readers of a Stream-mode RemoteCommand to
// two local streams, one thread per reader. Output is forwarded line by line
// with a "{:>15}: " host prefix (unless no_host), so lines from different
// hosts never interleave mid-line.
class StreamPump {
public:
    StreamPump(std::ostream& out, std::ostream& err, bool no_host);
    ~StreamPump();

    StreamPump(const StreamPump&) = delete;
    StreamPump& operator=(const StreamPump&) = delete;

    // Spawn reader threads for every registered host. Call after the
    // command's ready handshake.
    void attach(const RemoteCommand& rc);

    // Wait for every reader to hit end of stream.
    void join();

private:
    std::ostream& out_;
    std::ostream& err_;
    bool no_host_;
    std::mutex write_mutex_;
    std::vector<std::thread> threads_;

    void pump(std::string host, std::shared_ptr<Reader> reader, std::ostream& dest);
    void write_line(const std::string& host, const std::string& line, std::ostream& dest);
};

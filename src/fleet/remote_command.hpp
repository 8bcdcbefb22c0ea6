#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>

enum class ExecMode {
    Capture,  // run to completion, buffer stdout per host
    Stream,   // expose live stdout/stderr readers while the command runs
};

struct CommandOptions {
    ExecMode mode = ExecMode::Capture;
    bool gzip = false;                   // pipe remote output through gzip
    int default_port = DEFAULT_SSH_PORT; // for hosts given without :port
};

struct StreamReaders {
    std::shared_ptr<Reader> out;
    std::shared_ptr<Reader> err;
};

// RemoteCommand: runs one command on many hosts at once.
//
// start() launches one thread per host and joins them all before returning.
// Workers write their results into shared maps under a single mutex; every
// map is keyed by the host string exactly as the caller passed it.
//
// In Stream mode each worker registers its session and readers, starts the
// command and then blocks until it exits, so start() only returns once every
// remote command is done. Callers that want to consume the streams run
// start() on another thread and use wait_ready() / on_ready() to learn when
// every host has either registered its readers or failed.
//
// One instance per command; it cannot be restarted.
class RemoteCommand {
public:
    RemoteCommand(std::vector<std::string> hosts, std::string command,
                  CommandOptions options, std::shared_ptr<Transport> transport);
    ~RemoteCommand();

    RemoteCommand(const RemoteCommand&) = delete;
    RemoteCommand& operator=(const RemoteCommand&) = delete;

    // Errors only for configuration-level failures (no host attempted).
    // Per-host failures land in errors().
    Result<void> start();

    // Block until every worker has reached its ready point.
    void wait_ready();

    // Invoked once, from the thread that completes the ready handshake.
    // If the handshake already completed, runs immediately.
    void on_ready(std::function<void()> callback);

    // Stream mode: SIGTERM + close every live session. Best-effort.
    void close_pipe();

    const std::vector<std::string>& hosts() const { return hosts_; }
    const std::string& command() const { return command_; }
    ExecMode mode() const { return options_.mode; }
    bool gzip() const { return options_.gzip; }

    // Snapshots taken under the aggregation lock
    std::unordered_map<std::string, std::string> outputs() const;
    std::unordered_map<std::string, std::string> errors() const;
    std::unordered_map<std::string, std::shared_ptr<Session>> live_sessions() const;
    std::unordered_map<std::string, StreamReaders> live_readers() const;

private:
    // Marks its worker ready exactly once: explicitly via fire(), or on scope
    // exit for workers that bail out early.
    class ReadyGuard {
    public:
        explicit ReadyGuard(RemoteCommand& rc) : rc_(rc) {}
        ~ReadyGuard() { fire(); }
        void fire();

    private:
        RemoteCommand& rc_;
        bool fired_ = false;
    };

    const std::vector<std::string> hosts_;
    const std::string command_;
    const CommandOptions options_;
    std::shared_ptr<Transport> transport_;
    bool started_ = false;

    // Aggregation state: lock_ guards all four maps
    mutable std::mutex lock_;
    std::unordered_map<std::string, std::string> outputs_;
    std::unordered_map<std::string, std::string> errors_;
    std::unordered_map<std::string, std::shared_ptr<Session>> live_sessions_;
    std::unordered_map<std::string, StreamReaders> live_readers_;

    // Ready handshake
    std::mutex ready_mutex_;
    std::condition_variable ready_cv_;
    size_t pending_ready_;
    std::function<void()> ready_callback_;

    void execute(const std::string& host);
    void capture(const std::string& host, Session& session);
    void stream(const std::string& host, const std::shared_ptr<Session>& session,
                ReadyGuard& ready);
    void record_error(const std::string& host, const std::string& error);
    void mark_ready(size_t count = 1);
};

#include "remote_command.hpp"
#include <core/log.hpp>
#include <ssh/host_address.hpp>
#include <fmt/format.h>
#include <system_error>
#include <thread>

static std::string with_gzip(std::string command, bool gzip) {
    if (gzip) command += GZIP_PIPE_SUFFIX;
    return command;
}

RemoteCommand::RemoteCommand(std::vector<std::string> hosts, std::string command,
                             CommandOptions options, std::shared_ptr<Transport> transport)
    : hosts_(std::move(hosts)),
      command_(with_gzip(std::move(command), options.gzip)),
      options_(options),
      transport_(std::move(transport)),
      pending_ready_(hosts_.size()) {
}

RemoteCommand::~RemoteCommand() = default;

Result<void> RemoteCommand::start() {
    if (started_) {
        return Result<void>::Err("command already started");
    }
    started_ = true;

    if (hosts_.empty()) {
        return Result<void>::Ok();
    }

    auto prepared = transport_->prepare();
    if (prepared.is_err()) {
        // Nobody will run: release anyone blocked in wait_ready()
        mark_ready(hosts_.size());
        return Result<void>::Err(prepared.error);
    }

    fleet_log(fmt::format("start: {} host(s), mode={}, cmd={}", hosts_.size(),
                          options_.mode == ExecMode::Stream ? "stream" : "capture",
                          command_));

    std::vector<std::thread> workers;
    workers.reserve(hosts_.size());
    for (const auto& host : hosts_) {
        try {
            workers.emplace_back(&RemoteCommand::execute, this, host);
        } catch (const std::system_error& e) {
            record_error(host, fmt::format("cannot start worker: {}", e.what()));
            mark_ready();
        }
    }
    for (auto& worker : workers) {
        worker.join();
    }

    fleet_log(fmt::format("done: {} output(s), {} error(s)",
                          outputs().size(), errors().size()));
    return Result<void>::Ok();
}

void RemoteCommand::execute(const std::string& host) {
    ReadyGuard ready(*this);

    std::string address = normalize_host(host, options_.default_port);
    auto dialed = transport_->dial(address);
    if (dialed.is_err()) {
        record_error(host, dialed.error);
        return;
    }
    // Released on every exit path; in Stream mode the session keeps the
    // underlying transport alive for as long as it is registered.
    std::shared_ptr<Connection> connection = std::move(dialed.value);

    auto opened = connection->new_session();
    if (opened.is_err()) {
        record_error(host, opened.error);
        return;
    }

    if (options_.mode == ExecMode::Stream) {
        stream(host, opened.value, ready);
    } else {
        capture(host, *opened.value);
    }
}

void RemoteCommand::capture(const std::string& host, Session& session) {
    auto result = session.output(command_);
    if (result.is_ok()) {
        fleet_log_ssh(host, command_, result.value);
    }

    std::lock_guard<std::mutex> lock(lock_);
    if (result.is_err()) {
        errors_[host] = result.error;
        return;
    }
    // A failed host lands in errors only; its stdout is in the debug log
    const SSHResult& r = result.value;
    if (r.success()) {
        outputs_[host] = r.stdout_data;
    } else {
        errors_[host] = exit_error(r);
    }
}

void RemoteCommand::stream(const std::string& host, const std::shared_ptr<Session>& session,
                           ReadyGuard& ready) {
    StreamReaders readers{session->stdout_pipe(), session->stderr_pipe()};
    {
        std::lock_guard<std::mutex> lock(lock_);
        live_sessions_[host] = session;
        live_readers_[host] = readers;
    }

    auto started = session->start(command_);
    if (started.is_err()) {
        // Never ran: not live, and nothing left for its readers to drain
        {
            std::lock_guard<std::mutex> lock(lock_);
            live_sessions_.erase(host);
            live_readers_.erase(host);
        }
        session->close();
        record_error(host, started.error);
        return;
    }
    ready.fire();

    auto waited = session->wait();
    if (waited.is_err()) {
        record_error(host, waited.error);
        return;
    }
    if (waited.value.failed()) {
        record_error(host, exit_error(waited.value));
        return;
    }
    fleet_log(fmt::format("{}: remote command exited", host));
}

void RemoteCommand::record_error(const std::string& host, const std::string& error) {
    fleet_log(fmt::format("{}: {}", host, error));
    std::lock_guard<std::mutex> lock(lock_);
    errors_[host] = error;
}

void RemoteCommand::ReadyGuard::fire() {
    if (fired_) return;
    fired_ = true;
    rc_.mark_ready();
}

void RemoteCommand::mark_ready(size_t count) {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(ready_mutex_);
        if (pending_ready_ == 0) return;
        pending_ready_ = count >= pending_ready_ ? 0 : pending_ready_ - count;
        if (pending_ready_ != 0) return;
        callback = std::move(ready_callback_);
        ready_callback_ = nullptr;
    }
    ready_cv_.notify_all();
    if (callback) callback();
}

void RemoteCommand::wait_ready() {
    std::unique_lock<std::mutex> lock(ready_mutex_);
    ready_cv_.wait(lock, [this] { return pending_ready_ == 0; });
}

void RemoteCommand::on_ready(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(ready_mutex_);
        if (pending_ready_ != 0) {
            ready_callback_ = std::move(callback);
            return;
        }
    }
    if (callback) callback();
}

void RemoteCommand::close_pipe() {
    auto sessions = live_sessions();
    for (auto& [host, session] : sessions) {
        if (!session) continue;
        auto signalled = session->signal("TERM");
        if (signalled.is_err()) {
            fleet_log(fmt::format("{}: {}", host, signalled.error));
        }
        session->close();
    }
    fleet_log(fmt::format("close_pipe: {} session(s)", sessions.size()));
}

std::unordered_map<std::string, std::string> RemoteCommand::outputs() const {
    std::lock_guard<std::mutex> lock(lock_);
    return outputs_;
}

std::unordered_map<std::string, std::string> RemoteCommand::errors() const {
    std::lock_guard<std::mutex> lock(lock_);
    return errors_;
}

std::unordered_map<std::string, std::shared_ptr<Session>> RemoteCommand::live_sessions() const {
    std::lock_guard<std::mutex> lock(lock_);
    return live_sessions_;
}

std::unordered_map<std::string, StreamReaders> RemoteCommand::live_readers() const {
    std::lock_guard<std::mutex> lock(lock_);
    return live_readers_;
}

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/constants.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"
#include "auth.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

class CredentialManager;

// One TCP socket + libssh2 session (non-blocking). Shared by the connection,
// its sessions and their readers; torn down when the last owner lets go.
struct SSHLink {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = FLEETCMD_INVALID_SOCKET;
    std::mutex io_mutex;  // every libssh2 call on this session holds it

    SSHLink() = default;
    SSHLink(const SSHLink&) = delete;
    SSHLink& operator=(const SSHLink&) = delete;
    ~SSHLink();
};

// An exec channel and the link it lives on.
struct SSHChannel {
    std::shared_ptr<SSHLink> link;
    LIBSSH2_CHANNEL* channel = nullptr;
    std::atomic<bool> closed{false};

    SSHChannel() = default;
    SSHChannel(const SSHChannel&) = delete;
    SSHChannel& operator=(const SSHChannel&) = delete;
    ~SSHChannel();
};

class SSHReader : public Reader {
public:
    SSHReader(std::shared_ptr<SSHChannel> channel, int stream_id);

    long read(char* buf, size_t len) override;

private:
    std::shared_ptr<SSHChannel> channel_;
    int stream_id_;
};

class SSHSession : public Session {
public:
    explicit SSHSession(std::shared_ptr<SSHChannel> channel);

    Result<SSHResult> output(const std::string& cmd) override;
    std::shared_ptr<Reader> stdout_pipe() override;
    std::shared_ptr<Reader> stderr_pipe() override;
    Result<void> start(const std::string& cmd) override;
    Result<SSHResult> wait() override;
    Result<void> signal(const std::string& name) override;
    void close() override;

private:
    std::shared_ptr<SSHChannel> channel_;

    Result<void> exec(const std::string& cmd);
    void close_channel();
    SSHResult collect_exit();
};

class SSHConnection : public Connection {
public:
    explicit SSHConnection(std::shared_ptr<SSHLink> link);
    ~SSHConnection() override;

    Result<std::shared_ptr<Session>> new_session() override;
    void close() override;

private:
    std::shared_ptr<SSHLink> link_;
};

// Dials with a permissive host-key policy: the remote identity is never
// checked against known_hosts.
class SSHTransport : public Transport {
public:
    SSHTransport(AuthConfig config, CredentialManager& creds,
                 int timeout_secs = SSH_DIAL_TIMEOUT_SECS);

    Result<void> prepare() override;
    Result<std::shared_ptr<Connection>> dial(const std::string& address) override;

private:
    using Deadline = std::chrono::steady_clock::time_point;

    AuthConfig config_;
    CredentialManager& creds_;
    int timeout_secs_;
    std::optional<AuthMaterial> auth_;

    Result<void> authenticate(SSHLink& link, Deadline deadline);
};

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <core/types.hpp>

// Transport seam: the coordinator only talks to these interfaces.
// SSHTransport (libssh2) is the production implementation; tests plug in
// an in-memory fake.

// Readable end of a remote stdout/stderr stream.
class Reader {
public:
    virtual ~Reader() = default;

    // Blocks until data is available. Returns bytes read, 0 at end of
    // stream, or -1 on error.
    virtual long read(char* buf, size_t len) = 0;
};

// One command-execution channel on a connection.
class Session {
public:
    virtual ~Session() = default;

    // Run cmd to completion. Ok carries exit status, stdout and stderr;
    // Err is a transport-level failure.
    virtual Result<SSHResult> output(const std::string& cmd) = 0;

    // Readers must be taken before start(). They may be left undrained:
    // wait() still returns once the command exits, provided its output fits
    // in the channel window.
    virtual std::shared_ptr<Reader> stdout_pipe() = 0;
    virtual std::shared_ptr<Reader> stderr_pipe() = 0;

    virtual Result<void> start(const std::string& cmd) = 0;

    // Block until the remote command exits. Ok carries the exit status only.
    virtual Result<SSHResult> wait() = 0;

    // Deliver a signal by name without the "SIG" prefix ("TERM", "KILL").
    virtual Result<void> signal(const std::string& name) = 0;

    virtual void close() = 0;
};

class Connection {
public:
    virtual ~Connection() = default;

    virtual Result<std::shared_ptr<Session>> new_session() = 0;
    virtual void close() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Build whatever every dial needs (auth material). Failure here is a
    // configuration error: no host should be attempted.
    virtual Result<void> prepare() { return Result<void>::Ok(); }

    // address is "host:port" or "[v6addr]:port".
    virtual Result<std::shared_ptr<Connection>> dial(const std::string& address) = 0;
};

// "Process exited with status N" or
// "Process exited with status -1 from signal NAME", then any remote stderr;
// "" when the command succeeded.
std::string exit_error(const SSHResult& r);

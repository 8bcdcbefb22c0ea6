#include "ssh_transport.hpp"
#include "host_address.hpp"
#include <core/credentials.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <cstring>
#include <vector>

using Clock = std::chrono::steady_clock;

constexpr int SSH_OP_TIMEOUT_MS   = 5000;   // close / signal / disconnect
constexpr int SSH_EXEC_TIMEOUT_MS = 30000;  // channel open / exec request

// Caller must hold link.io_mutex if the session is shared.
static std::string last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0) return "unknown error";
    return std::string(msg, static_cast<size_t>(len));
}

// Call fn under the io mutex until it stops returning EAGAIN or the
// timeout expires. Returns fn's last return value.
template <typename Fn>
static int with_retry(SSHLink& link, Fn fn, int timeout_ms = SSH_OP_TIMEOUT_MS) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(link.io_mutex);
            rc = static_cast<int>(fn());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN || Clock::now() >= deadline) return rc;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
}

// ── SSHLink / SSHChannel ───────────────────────────────────────

SSHLink::~SSHLink() {
    if (session) {
        with_retry(*this, [&] {
            return libssh2_session_disconnect(session, "Normal disconnection");
        });
        libssh2_session_free(session);
        session = nullptr;
    }
    if (sock != FLEETCMD_INVALID_SOCKET) {
        platform::close_socket(sock);
        sock = FLEETCMD_INVALID_SOCKET;
    }
}

SSHChannel::~SSHChannel() {
    if (!channel || !link) return;
    if (!closed.exchange(true)) {
        with_retry(*link, [&] { return libssh2_channel_close(channel); });
    }
    with_retry(*link, [&] { return libssh2_channel_free(channel); });
    channel = nullptr;
}

// ── SSHReader ──────────────────────────────────────────────────

SSHReader::SSHReader(std::shared_ptr<SSHChannel> channel, int stream_id)
    : channel_(std::move(channel)), stream_id_(stream_id) {
}

long SSHReader::read(char* buf, size_t len) {
    SSHLink& link = *channel_->link;
    while (true) {
        if (channel_->closed) return 0;

        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(link.io_mutex);
            // 0 once the remote sent EOF and this stream is empty, even if
            // the other stream still has data queued
            n = libssh2_channel_read_ex(channel_->channel, stream_id_, buf, len);
        }
        if (n >= 0) return static_cast<long>(n);
        if (n != LIBSSH2_ERROR_EAGAIN) {
            // A read racing with close() is end of stream, not an error
            return channel_->closed ? 0 : -1;
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
}

// ── SSHSession ─────────────────────────────────────────────────

SSHSession::SSHSession(std::shared_ptr<SSHChannel> channel)
    : channel_(std::move(channel)) {
}

Result<void> SSHSession::exec(const std::string& cmd) {
    SSHLink& link = *channel_->link;
    int rc = with_retry(link, [&] {
        return libssh2_channel_exec(channel_->channel, cmd.c_str());
    }, SSH_EXEC_TIMEOUT_MS);
    if (rc != 0) {
        std::lock_guard<std::mutex> lock(link.io_mutex);
        return Result<void>::Err("ssh: failed to start command: " + last_error(link.session));
    }
    return Result<void>::Ok();
}

Result<SSHResult> SSHSession::output(const std::string& cmd) {
    auto started = exec(cmd);
    if (started.is_err()) {
        return Result<SSHResult>::Err(started.error);
    }

    SSHLink& link = *channel_->link;
    std::string out;
    std::string err;
    char buf[SSH_READ_BUF_SIZE];

    bool done[] = {false, false};
    const int streams[] = {0, SSH_EXTENDED_DATA_STDERR};
    while (!done[0] || !done[1]) {
        bool progressed = false;
        for (int i = 0; i < 2; i++) {
            if (done[i]) continue;
            ssize_t n;
            {
                std::lock_guard<std::mutex> lock(link.io_mutex);
                n = libssh2_channel_read_ex(channel_->channel, streams[i], buf, sizeof(buf));
                if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                    return Result<SSHResult>::Err("ssh: read failed: " + last_error(link.session));
                }
            }
            if (n > 0) {
                (i == 0 ? out : err).append(buf, static_cast<size_t>(n));
                progressed = true;
            } else if (n == 0) {
                done[i] = true;
            }
        }
        if (!progressed) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    close_channel();
    SSHResult result = collect_exit();
    result.stdout_data = std::move(out);
    result.stderr_data = std::move(err);
    return Result<SSHResult>::Ok(result);
}

std::shared_ptr<Reader> SSHSession::stdout_pipe() {
    return std::make_shared<SSHReader>(channel_, 0);
}

std::shared_ptr<Reader> SSHSession::stderr_pipe() {
    return std::make_shared<SSHReader>(channel_, SSH_EXTENDED_DATA_STDERR);
}

Result<void> SSHSession::start(const std::string& cmd) {
    return exec(cmd);
}

Result<SSHResult> SSHSession::wait() {
    SSHLink& link = *channel_->link;
    const std::string no_status = "wait: remote command exited without exit status or exit signal";
    while (true) {
        if (channel_->closed) {
            return Result<SSHResult>::Err(no_status);
        }
        // wait_eof pulls from the socket itself, so this completes even when
        // nobody drains the readers
        int rc;
        {
            std::lock_guard<std::mutex> lock(link.io_mutex);
            rc = libssh2_channel_wait_eof(channel_->channel);
            if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN && !channel_->closed) {
                return Result<SSHResult>::Err("wait: " + last_error(link.session));
            }
        }
        if (rc == 0) break;
        if (rc != LIBSSH2_ERROR_EAGAIN) return Result<SSHResult>::Err(no_status);
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    return Result<SSHResult>::Ok(collect_exit());
}

Result<void> SSHSession::signal(const std::string& name) {
    if (channel_->closed) {
        return Result<void>::Err("ssh: session already closed");
    }
    SSHLink& link = *channel_->link;
    int rc = with_retry(link, [&] {
        return libssh2_channel_signal_ex(channel_->channel, name.c_str(), name.size());
    });
    if (rc != 0) {
        std::lock_guard<std::mutex> lock(link.io_mutex);
        return Result<void>::Err(fmt::format("ssh: signal {} failed: {}", name, last_error(link.session)));
    }
    return Result<void>::Ok();
}

void SSHSession::close() {
    close_channel();
}

void SSHSession::close_channel() {
    if (channel_->closed.exchange(true)) return;
    with_retry(*channel_->link, [&] { return libssh2_channel_close(channel_->channel); });
}

SSHResult SSHSession::collect_exit() {
    SSHLink& link = *channel_->link;
    // Remote EOF is enough; the channel stays open so readers can drain it
    with_retry(link, [&] { return libssh2_channel_wait_closed(channel_->channel); });

    SSHResult result{0, "", "", ""};
    std::lock_guard<std::mutex> lock(link.io_mutex);
    result.exit_code = libssh2_channel_get_exit_status(channel_->channel);

    char* sig = nullptr;
    size_t sig_len = 0;
    libssh2_channel_get_exit_signal(channel_->channel, &sig, &sig_len,
                                    nullptr, nullptr, nullptr, nullptr);
    if (sig) {
        result.exit_signal.assign(sig, sig_len);
        result.exit_code = -1;
        libssh2_free(link.session, sig);
    }
    return result;
}

// ── SSHConnection ──────────────────────────────────────────────

SSHConnection::SSHConnection(std::shared_ptr<SSHLink> link)
    : link_(std::move(link)) {
}

SSHConnection::~SSHConnection() {
    close();
}

Result<std::shared_ptr<Session>> SSHConnection::new_session() {
    if (!link_) {
        return Result<std::shared_ptr<Session>>::Err("ssh: connection closed");
    }

    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = Clock::now() + std::chrono::milliseconds(SSH_EXEC_TIMEOUT_MS);
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            ch = libssh2_channel_open_session(link_->session);
            if (!ch && libssh2_session_last_errno(link_->session) != LIBSSH2_ERROR_EAGAIN) {
                return Result<std::shared_ptr<Session>>::Err(
                    "ssh: failed to open session: " + last_error(link_->session));
            }
        }
        if (ch) break;
        if (Clock::now() >= deadline) {
            return Result<std::shared_ptr<Session>>::Err("ssh: timed out opening session");
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    auto channel = std::make_shared<SSHChannel>();
    channel->link = link_;
    channel->channel = ch;
    return Result<std::shared_ptr<Session>>::Ok(std::make_shared<SSHSession>(channel));
}

void SSHConnection::close() {
    // Sessions keep the link alive until they are released too
    link_.reset();
}

// ── SSHTransport ───────────────────────────────────────────────

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    const AuthMaterial* auth = static_cast<const AuthMaterial*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(auth->password.c_str());
        responses[i].length = static_cast<unsigned int>(auth->password.length());
    }
}

SSHTransport::SSHTransport(AuthConfig config, CredentialManager& creds, int timeout_secs)
    : config_(std::move(config)), creds_(creds), timeout_secs_(timeout_secs) {
}

Result<void> SSHTransport::prepare() {
    static std::once_flag init_once;
    static int init_rc = 0;
    std::call_once(init_once, [] { init_rc = libssh2_init(0); });
    if (init_rc != 0) {
        return Result<void>::Err("Failed to initialize libssh2");
    }

    if (auth_) return Result<void>::Ok();

    auto auth = build_auth(config_, creds_);
    if (auth.is_err()) {
        return Result<void>::Err(auth.error);
    }
    auth_ = auth.value;
    fleet_log(fmt::format("auth: user={} key={} password={}", auth_->user,
                          auth_->has_key() ? auth_->private_key : "-",
                          auth_->has_password() ? "yes" : "no"));
    return Result<void>::Ok();
}

Result<std::shared_ptr<Connection>> SSHTransport::dial(const std::string& address) {
    using ConnResult = Result<std::shared_ptr<Connection>>;

    if (!auth_) {
        return ConnResult::Err("ssh: transport not prepared");
    }

    auto target = split_host_port(address);
    if (target.is_err()) {
        return ConnResult::Err(target.error);
    }

    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs_);
    auto sock = platform::connect_tcp(target.value.host, target.value.port, timeout_secs_ * 1000);
    if (sock.is_err()) {
        return ConnResult::Err(sock.error);
    }

    // Not shared yet: no locking needed until the connection is handed out
    auto link = std::make_shared<SSHLink>();
    link->sock = sock.value;
    link->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!link->session) {
        return ConnResult::Err("ssh: failed to create session");
    }
    libssh2_session_set_blocking(link->session, 0);

    int rc;
    while ((rc = libssh2_session_handshake(link->session, link->sock)) == LIBSSH2_ERROR_EAGAIN) {
        if (Clock::now() >= deadline) {
            return ConnResult::Err("ssh: handshake failed: i/o timeout");
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        return ConnResult::Err("ssh: handshake failed: " + last_error(link->session));
    }

    auto auth = authenticate(*link, deadline);
    if (auth.is_err()) {
        return ConnResult::Err(auth.error);
    }

    return ConnResult::Ok(std::make_shared<SSHConnection>(link));
}

Result<void> SSHTransport::authenticate(SSHLink& link, Deadline deadline) {
    const AuthMaterial& auth = *auth_;
    LIBSSH2_SESSION* s = link.session;
    const auto user_len = static_cast<unsigned int>(auth.user.length());
    const std::string timeout_error = "ssh: handshake failed: i/o timeout";

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(s, auth.user.c_str(), user_len)) == nullptr) {
        if (libssh2_userauth_authenticated(s)) return Result<void>::Ok();
        if (libssh2_session_last_errno(s) != LIBSSH2_ERROR_EAGAIN) break;
        if (Clock::now() >= deadline) return Result<void>::Err(timeout_error);
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    std::string methods = auth_list ? auth_list : "";
    std::vector<std::string> attempted;
    int rc;

    if (auth.has_key() && (methods.empty() || methods.find("publickey") != std::string::npos)) {
        attempted.push_back("publickey");
        const char* passphrase = auth.passphrase.empty() ? nullptr : auth.passphrase.c_str();
        while ((rc = libssh2_userauth_publickey_fromfile_ex(
                    s, auth.user.c_str(), user_len, nullptr,
                    auth.private_key.c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            if (Clock::now() >= deadline) return Result<void>::Err(timeout_error);
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
        if (rc == 0) return Result<void>::Ok();
        fleet_log("publickey auth failed: " + last_error(s));
    }

    if (auth.has_password() && (methods.empty() || methods.find("password") != std::string::npos)) {
        attempted.push_back("password");
        while ((rc = libssh2_userauth_password_ex(
                    s, auth.user.c_str(), user_len,
                    auth.password.c_str(), static_cast<unsigned int>(auth.password.length()),
                    nullptr)) == LIBSSH2_ERROR_EAGAIN) {
            if (Clock::now() >= deadline) return Result<void>::Err(timeout_error);
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
        if (rc == 0) return Result<void>::Ok();
        fleet_log("password auth failed: " + last_error(s));
    }

    if (auth.has_password() && methods.find("keyboard-interactive") != std::string::npos) {
        attempted.push_back("keyboard-interactive");
        *libssh2_session_abstract(s) = const_cast<AuthMaterial*>(&auth);
        while ((rc = libssh2_userauth_keyboard_interactive_ex(
                    s, auth.user.c_str(), user_len, kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (Clock::now() >= deadline) return Result<void>::Err(timeout_error);
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
        if (rc == 0) return Result<void>::Ok();
        fleet_log("keyboard-interactive auth failed: " + last_error(s));
    }

    return Result<void>::Err(fmt::format(
        "ssh: handshake failed: ssh: unable to authenticate, attempted methods [{}], "
        "no supported methods remain", fmt::join(attempted, " ")));
}

#include "fleet_cli.hpp"
#include "stream_pump.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/credentials.hpp>
#include <core/log.hpp>
#include <fleet/remote_command.hpp>
#include <fleet/report.hpp>
#include <platform/platform.hpp>
#include <ssh/ssh_transport.hpp>
#include <fmt/format.h>
#include <atomic>
#include <csignal>
#include <memory>
#include <thread>
#include <termios.h>
#include <unistd.h>

// ── Interrupt handling (stream mode) ────────────────────────

static volatile sig_atomic_t g_interrupted = 0;
static struct sigaction g_old_int;
static struct sigaction g_old_term;

static void interrupt_handler(int) {
    g_interrupted = 1;
}

// Installs SIGINT/SIGTERM handlers for its lifetime.
class InterruptGuard {
public:
    InterruptGuard() {
        g_interrupted = 0;
        struct sigaction sa;
        sa.sa_handler = interrupt_handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGINT, &sa, &g_old_int);
        sigaction(SIGTERM, &sa, &g_old_term);
    }
    ~InterruptGuard() {
        sigaction(SIGINT, &g_old_int, nullptr);
        sigaction(SIGTERM, &g_old_term, nullptr);
    }
};

// Read a line from stdin with echo disabled when stdin is a terminal.
static std::string read_secret(std::ostream& out, const std::string& prompt) {
    out << prompt;
    out.flush();

    struct termios saved;
    bool tty = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved) == 0;
    if (tty) {
        struct termios noecho = saved;
        noecho.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &noecho);
    }

    std::string value;
    std::getline(std::cin, value);

    if (tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved);
        out << "\n";
    }
    return value;
}

FleetCLI::FleetCLI(std::ostream& out, std::ostream& err) : out_(out), err_(err) {
}

int FleetCLI::run(const CliOptions& opts) {
    switch (opts.action) {
        case CliAction::Help:
            print_usage();
            return 0;
        case CliAction::Version:
            print_version();
            return 0;
        case CliAction::Init:
            return run_init();
        case CliAction::Credentials:
            return run_credentials(opts.sub_args);
        case CliAction::Run:
            break;
    }
    return run_command(opts);
}

void FleetCLI::print_usage() {
    out_ << theme::section("Usage");
    out_ << theme::usage_row("fleetcmd [options] HOST... -- CMD", "Run CMD on every host");
    out_ << theme::usage_row("fleetcmd -H h1,h2 -c CMD", "Same, hosts and command as options");
    out_ << theme::usage_row("fleetcmd init", "Write ~/.fleetcmd/config.yaml");
    out_ << theme::usage_row("fleetcmd credentials list", "Show stored credential keys");
    out_ << theme::usage_row("fleetcmd credentials set KEY [VALUE]", "Store a secret (password, passphrase)");
    out_ << theme::usage_row("fleetcmd credentials remove KEY", "Delete a stored secret");
    out_ << theme::section("Options");
    out_ << theme::usage_row("-s, --stream", "Stream output line by line as it arrives");
    out_ << theme::usage_row("-z, --gzip / --no-gzip", "Compress remote output in transit");
    out_ << theme::usage_row("-p, --port N", "Port for hosts given without one");
    out_ << theme::usage_row("-u, --user USER", "Remote user");
    out_ << theme::usage_row("-i, --key PATH", "Private key file");
    out_ << theme::usage_row("--config PATH", "Config file instead of ~/.fleetcmd/config.yaml");
    out_ << theme::usage_row("--no-header", "Omit the ERROR / OUTPUT banners");
    out_ << theme::usage_row("--no-host", "Omit host labels and the error section");
    out_ << theme::usage_row("--version", "Show version");
    out_ << theme::usage_row("-h, --help", "Show this help");
    out_ << "\n";
}

void FleetCLI::print_version() {
    out_ << theme::brown("fleetcmd") << theme::dim(fmt::format(" version {}", FLEETCMD_VERSION))
         << "\n";
}

// ── init ────────────────────────────────────────────────────

int FleetCLI::run_init() {
    if (global_config_exists()) {
        err_ << theme::info("Config already exists: " + get_global_config_path().string());
        return 0;
    }
    auto r = create_default_global_config();
    if (r.is_err()) {
        err_ << theme::fail(r.error);
        return 1;
    }
    err_ << theme::ok("Wrote " + get_global_config_path().string());
    return 0;
}

// ── credentials ─────────────────────────────────────────────

int FleetCLI::run_credentials(const std::vector<std::string>& args) {
    auto& creds = CredentialManager::instance();
    std::string sub = args.empty() ? "list" : args[0];

    if (sub == "list") {
        auto entries = creds.list();
        if (entries.empty()) {
            err_ << theme::info("No stored credentials");
            return 0;
        }
        for (const auto& e : entries) {
            out_ << theme::kv(e.key, e.has_value ? "set" : "empty");
        }
        return 0;
    }

    if (sub == "set") {
        if (args.size() < 2) {
            err_ << theme::fail("Usage: fleetcmd credentials set KEY [VALUE]");
            return 1;
        }
        std::string value = args.size() >= 3
            ? args[2]
            : read_secret(err_, theme::color::BROWN + "    " + args[1] + ": " + theme::color::RESET);
        if (value.empty()) {
            err_ << theme::fail("Empty value, nothing stored");
            return 1;
        }
        auto r = creds.set(args[1], value);
        if (r.is_err()) {
            err_ << theme::fail(r.error);
            return 1;
        }
        err_ << theme::ok("Stored " + args[1]);
        return 0;
    }

    if (sub == "remove") {
        if (args.size() < 2) {
            err_ << theme::fail("Usage: fleetcmd credentials remove KEY");
            return 1;
        }
        auto r = creds.remove(args[1]);
        if (r.is_err()) {
            err_ << theme::fail(r.error);
            return 1;
        }
        err_ << theme::ok("Removed " + args[1]);
        return 0;
    }

    err_ << theme::fail("Unknown credentials command: " + sub);
    err_ << theme::step("Usage: fleetcmd credentials list|set|remove");
    return 1;
}

// ── run ─────────────────────────────────────────────────────

Result<Config> FleetCLI::load_config(const CliOptions& opts) {
    auto loaded = opts.config_path ? Config::load(*opts.config_path) : Config::load_global();
    if (loaded.is_err()) return loaded;

    Config config = loaded.value;
    if (opts.port) config.set_default_port(*opts.port);
    if (opts.gzip) config.set_gzip(*opts.gzip);
    if (opts.user) config.set_user(*opts.user);
    if (opts.key) config.set_private_key(*opts.key);
    return Result<Config>::Ok(config);
}

int FleetCLI::run_command(const CliOptions& opts) {
    auto config = load_config(opts);
    if (config.is_err()) {
        err_ << theme::fail(config.error);
        return 1;
    }
    set_fleet_log_path(config.value.log().path);

    return opts.stream ? run_stream(opts, config.value) : run_capture(opts, config.value);
}

int FleetCLI::run_capture(const CliOptions& opts, const Config& config) {
    auto transport = std::make_shared<SSHTransport>(config.auth(), CredentialManager::instance());

    CommandOptions copts;
    copts.mode = ExecMode::Capture;
    copts.gzip = config.gzip();
    copts.default_port = config.server().default_port;

    RemoteCommand rc(opts.hosts, opts.command, copts, transport);
    auto started = rc.start();
    if (started.is_err()) {
        err_ << theme::fail(started.error);
        return 1;
    }

    print_report(rc, err_, out_, opts.no_header, opts.no_host);
    return rc.errors().empty() ? 0 : 1;
}

int FleetCLI::run_stream(const CliOptions& opts, const Config& config) {
    auto transport = std::make_shared<SSHTransport>(config.auth(), CredentialManager::instance());

    // Lines are forwarded as they arrive, so the gzip pipe has nothing to offer
    CommandOptions copts;
    copts.mode = ExecMode::Stream;
    copts.gzip = false;
    copts.default_port = config.server().default_port;

    RemoteCommand rc(opts.hosts, opts.command, copts, transport);
    StreamPump pump(out_, err_, opts.no_host);
    InterruptGuard interrupts;

    Result<void> started = Result<void>::Ok();
    std::thread runner([&] { started = rc.start(); });

    rc.wait_ready();
    pump.attach(rc);

    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        while (!finished) {
            if (g_interrupted) {
                fleet_log("interrupted, terminating remote commands");
                rc.close_pipe();
                break;
            }
            platform::sleep_ms(INTERRUPT_POLL_MS);
        }
    });

    runner.join();
    finished = true;
    watcher.join();
    pump.join();

    if (started.is_err()) {
        err_ << theme::fail(started.error);
        return 1;
    }

    auto errors = rc.errors();
    ReportOptions ropts;
    ropts.no_header = opts.no_header;
    ropts.no_host = opts.no_host;
    render_report(errors, {}, err_, out_, ropts);
    return errors.empty() ? 0 : 1;
}

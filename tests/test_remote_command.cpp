#include <gtest/gtest.h>
#include <fleet/remote_command.hpp>
#include "fake_transport.hpp"
#include <algorithm>
#include <atomic>
#include <thread>

static FakeHost ok_host(const std::string& out) {
    FakeHost h;
    h.result = SSHResult{0, out, "", ""};
    return h;
}

static FakeHost failing_dial(const std::string& error) {
    FakeHost h;
    h.dial_error = error;
    return h;
}

static std::string drain(const std::shared_ptr<Reader>& reader) {
    std::string out;
    char buf[8];
    long n;
    while ((n = reader->read(buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

class RemoteCommandTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();

    CommandOptions capture_opts(bool gzip = false) {
        CommandOptions o;
        o.mode = ExecMode::Capture;
        o.gzip = gzip;
        return o;
    }

    CommandOptions stream_opts() {
        CommandOptions o;
        o.mode = ExecMode::Stream;
        return o;
    }
};

// ── Capture mode ────────────────────────────────────────────

TEST_F(RemoteCommandTest, EmptyHostListIsNoop) {
    RemoteCommand rc({}, "uptime", capture_opts(), transport);

    auto r = rc.start();
    EXPECT_TRUE(r.is_ok());
    EXPECT_TRUE(rc.outputs().empty());
    EXPECT_TRUE(rc.errors().empty());
    EXPECT_TRUE(transport->dialed().empty());

    rc.wait_ready();  // must not block
}

TEST_F(RemoteCommandTest, CaptureCollectsEveryHost) {
    transport->add("h1:22", ok_host("one\n"));
    transport->add("h2:22", ok_host("two\n"));
    transport->add("h3:22", ok_host("three\n"));

    RemoteCommand rc({"h1", "h2", "h3"}, "hostname", capture_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    auto outputs = rc.outputs();
    ASSERT_EQ(outputs.size(), 3u);
    EXPECT_EQ(outputs["h1"], "one\n");
    EXPECT_EQ(outputs["h2"], "two\n");
    EXPECT_EQ(outputs["h3"], "three\n");
    EXPECT_TRUE(rc.errors().empty());
    EXPECT_EQ(transport->dialed().size(), 3u);
}

TEST_F(RemoteCommandTest, ManyHostsFinishingTogetherAllRecorded) {
    std::vector<std::string> hosts;
    for (int i = 0; i < 64; i++) {
        std::string name = "node" + std::to_string(i);
        hosts.push_back(name);
        FakeHost h;
        if (i % 4 == 0) {
            h.result = SSHResult{1, "", "bad " + name, ""};
        } else {
            h.result = SSHResult{0, name + "\n", "", ""};
        }
        h.output_delay_ms = 20;
        transport->add(name + ":22", h);
    }

    RemoteCommand rc(hosts, "hostname", capture_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    auto outputs = rc.outputs();
    auto errors = rc.errors();
    EXPECT_EQ(outputs.size(), 48u);
    EXPECT_EQ(errors.size(), 16u);
    for (int i = 0; i < 64; i++) {
        std::string name = "node" + std::to_string(i);
        if (i % 4 == 0) {
            EXPECT_EQ(errors[name], "Process exited with status 1\nbad " + name);
            EXPECT_EQ(outputs.count(name), 0u);
        } else {
            EXPECT_EQ(outputs[name], name + "\n");
            EXPECT_EQ(errors.count(name), 0u);
        }
    }
}

TEST_F(RemoteCommandTest, EmptyOutputStillRecorded) {
    transport->fallback = ok_host("");

    RemoteCommand rc({"quiet"}, "true", capture_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    auto outputs = rc.outputs();
    ASSERT_EQ(outputs.count("quiet"), 1u);
    EXPECT_EQ(outputs["quiet"], "");
}

TEST_F(RemoteCommandTest, DialErrorKeyedByOriginalHost) {
    transport->add("db1:22", failing_dial("dial tcp db1:22: connection refused"));
    transport->add("web1:22", ok_host("up\n"));

    RemoteCommand rc({"db1", "web1"}, "uptime", capture_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    auto errors = rc.errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors["db1"], "dial tcp db1:22: connection refused");
    EXPECT_EQ(errors.count("db1:22"), 0u);
    EXPECT_EQ(rc.outputs().count("db1"), 0u);
    EXPECT_EQ(rc.outputs().count("web1"), 1u);
}

TEST_F(RemoteCommandTest, NonZeroExitRecordedAsErrorOnly) {
    FakeHost h;
    h.result = SSHResult{2, "partial\n", "boom\n", ""};
    transport->fallback = h;

    RemoteCommand rc({"h"}, "false", capture_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    EXPECT_TRUE(rc.outputs().empty());
    EXPECT_EQ(rc.errors()["h"], "Process exited with status 2\nboom");
}

TEST_F(RemoteCommandTest, EveryHostInExactlyOneMap) {
    transport->add("ok:22", ok_host("fine\n"));
    FakeHost bad;
    bad.result = SSHResult{1, "", "", ""};
    transport->add("bad:22", bad);
    transport->add("gone:22", failing_dial("dial tcp gone:22: no such host"));

    RemoteCommand rc({"ok", "bad", "gone"}, "true", capture_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    auto outputs = rc.outputs();
    auto errors = rc.errors();
    EXPECT_EQ(outputs.size() + errors.size(), 3u);
    for (const auto& host : rc.hosts()) {
        EXPECT_NE(outputs.count(host) == 1, errors.count(host) == 1) << host;
    }
    EXPECT_EQ(errors["bad"], "Process exited with status 1");
}

TEST_F(RemoteCommandTest, SessionAndExecErrorsRecorded) {
    FakeHost no_session;
    no_session.session_error = "ssh: open channel: administratively prohibited";
    FakeHost broken;
    broken.output_error = "ssh: exec: channel closed";
    transport->add("a:22", no_session);
    transport->add("b:22", broken);

    RemoteCommand rc({"a", "b"}, "ls", capture_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    auto errors = rc.errors();
    EXPECT_EQ(errors["a"], "ssh: open channel: administratively prohibited");
    EXPECT_EQ(errors["b"], "ssh: exec: channel closed");
    EXPECT_TRUE(rc.outputs().empty());
}

TEST_F(RemoteCommandTest, GzipSuffixAppendedOnce) {
    transport->fallback = ok_host("x");

    RemoteCommand rc({"h"}, "uptime", capture_opts(true), transport);
    EXPECT_EQ(rc.command(), "uptime | /usr/bin/gzip -f");
    EXPECT_TRUE(rc.gzip());

    ASSERT_TRUE(rc.start().is_ok());
    auto session = transport->session("h:22");
    ASSERT_NE(session, nullptr);
    auto events = session->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], "output:uptime | /usr/bin/gzip -f");
}

TEST_F(RemoteCommandTest, DefaultPortAppliedToBareHosts) {
    transport->fallback = ok_host("");
    CommandOptions o = capture_opts();
    o.default_port = 2222;

    RemoteCommand rc({"plain", "explicit:22", "::1", "[fe80::1]:2200"}, "true", o, transport);
    ASSERT_TRUE(rc.start().is_ok());

    auto dialed = transport->dialed();
    std::sort(dialed.begin(), dialed.end());
    std::vector<std::string> expected = {"[::1]:2222", "[fe80::1]:2200", "explicit:22", "plain:2222"};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(dialed, expected);

    auto outputs = rc.outputs();
    EXPECT_EQ(outputs.count("::1"), 1u);
    EXPECT_EQ(outputs.count("plain"), 1u);
}

TEST_F(RemoteCommandTest, PrepareFailureAttemptsNoHost) {
    transport->prepare_error = "No SSH credentials";

    RemoteCommand rc({"h1", "h2"}, "uptime", capture_opts(), transport);
    auto r = rc.start();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "No SSH credentials");
    EXPECT_TRUE(transport->dialed().empty());
    EXPECT_TRUE(rc.errors().empty());

    rc.wait_ready();  // released despite no worker running
}

TEST_F(RemoteCommandTest, SecondStartRejected) {
    transport->fallback = ok_host("x");

    RemoteCommand rc({"h"}, "true", capture_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    auto again = rc.start();
    EXPECT_TRUE(again.is_err());
    EXPECT_EQ(transport->dialed().size(), 1u);
}

// ── Stream mode ─────────────────────────────────────────────

TEST_F(RemoteCommandTest, StreamRegistersSessionsAndReaders) {
    FakeHost h;
    h.result = SSHResult{0, "line1\nline2\n", "warn\n", ""};
    transport->fallback = h;

    RemoteCommand rc({"h1", "h2"}, "tail -n2 log", stream_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    auto sessions = rc.live_sessions();
    auto readers = rc.live_readers();
    ASSERT_EQ(sessions.size(), 2u);
    ASSERT_EQ(readers.size(), 2u);
    EXPECT_EQ(drain(readers["h1"].out), "line1\nline2\n");
    EXPECT_EQ(drain(readers["h1"].err), "warn\n");
    EXPECT_TRUE(rc.errors().empty());
    EXPECT_TRUE(rc.outputs().empty());
}

TEST_F(RemoteCommandTest, StreamFinishesWithReadersUndrained) {
    FakeHost h;
    h.result = SSHResult{0, "out\n", "err\n", ""};
    transport->fallback = h;

    // Nobody waits for readiness or reads: start() still returns at exit
    RemoteCommand rc({"h"}, "echo", stream_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());
    EXPECT_TRUE(rc.errors().empty());

    // Only stderr is drained afterwards; stdout's pending data does not block it
    auto readers = rc.live_readers();
    EXPECT_EQ(drain(readers["h"].err), "err\n");
}

TEST_F(RemoteCommandTest, StreamNonZeroExitRecorded) {
    FakeHost h;
    h.result = SSHResult{3, "", "", ""};
    transport->fallback = h;

    RemoteCommand rc({"h"}, "exit 3", stream_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    EXPECT_EQ(rc.errors()["h"], "Process exited with status 3");
}

TEST_F(RemoteCommandTest, StreamStartErrorRecorded) {
    FakeHost h;
    h.start_error = "ssh: exec: request denied";
    transport->fallback = h;

    RemoteCommand rc({"h"}, "ls", stream_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    EXPECT_EQ(rc.errors()["h"], "ssh: exec: request denied");
    EXPECT_TRUE(rc.outputs().empty());
    EXPECT_EQ(rc.live_sessions().count("h"), 0u);
    EXPECT_EQ(rc.live_readers().count("h"), 0u);

    auto session = transport->session("h:22");
    ASSERT_NE(session, nullptr);
    auto events = session->events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "start:ls");
    EXPECT_EQ(events[1], "close");
}

TEST_F(RemoteCommandTest, StartErrorLeavesOtherHostsLive) {
    FakeHost refused;
    refused.start_error = "ssh: exec: request denied";
    FakeHost running;
    running.block_until_closed = true;
    transport->add("bad:22", refused);
    transport->add("good:22", running);

    RemoteCommand rc({"bad", "good"}, "sleep 3600", stream_opts(), transport);
    std::thread runner([&] { rc.start(); });
    rc.wait_ready();

    auto sessions = rc.live_sessions();
    EXPECT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions.count("good"), 1u);
    EXPECT_EQ(rc.live_readers().count("bad"), 0u);

    rc.close_pipe();
    runner.join();

    auto bad_events = transport->session("bad:22")->events();
    EXPECT_EQ(std::count(bad_events.begin(), bad_events.end(), "signal:TERM"), 0);
    EXPECT_EQ(rc.errors().size(), 2u);
}

TEST_F(RemoteCommandTest, ReadyFiresWhenEveryHostFails) {
    transport->fallback = failing_dial("dial tcp: no route to host");

    RemoteCommand rc({"a", "b", "c"}, "uptime", stream_opts(), transport);
    std::atomic<int> fired{0};
    rc.on_ready([&] { fired++; });

    std::thread runner([&] { rc.start(); });
    rc.wait_ready();
    runner.join();

    EXPECT_EQ(fired.load(), 1);
    EXPECT_EQ(rc.errors().size(), 3u);
    EXPECT_TRUE(rc.live_readers().empty());
}

TEST_F(RemoteCommandTest, OnReadyAfterHandshakeRunsImmediately) {
    transport->fallback = ok_host("");

    RemoteCommand rc({"h"}, "true", stream_opts(), transport);
    ASSERT_TRUE(rc.start().is_ok());

    bool ran = false;
    rc.on_ready([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST_F(RemoteCommandTest, ClosePipeTerminatesInFlightCommands) {
    FakeHost h;
    h.block_until_closed = true;
    transport->fallback = h;

    RemoteCommand rc({"h1", "h2"}, "sleep 3600", stream_opts(), transport);
    std::thread runner([&] { rc.start(); });
    rc.wait_ready();

    EXPECT_EQ(rc.live_sessions().size(), 2u);
    rc.close_pipe();
    runner.join();

    for (const std::string address : {"h1:22", "h2:22"}) {
        auto session = transport->session(address);
        ASSERT_NE(session, nullptr);
        auto events = session->events();
        ASSERT_EQ(events.size(), 3u);
        EXPECT_EQ(events[0], "start:sleep 3600");
        EXPECT_EQ(events[1], "signal:TERM");
        EXPECT_EQ(events[2], "close");
    }

    auto errors = rc.errors();
    EXPECT_EQ(errors["h1"], "Process exited with status -1 from signal TERM");
    EXPECT_EQ(errors["h2"], "Process exited with status -1 from signal TERM");
}

TEST_F(RemoteCommandTest, ClosePipeSkipsHostsThatNeverConnected) {
    FakeHost running;
    running.block_until_closed = true;
    transport->add("up:22", running);
    transport->add("down:22", failing_dial("dial tcp down:22: connection refused"));

    RemoteCommand rc({"down", "up"}, "sleep 3600", stream_opts(), transport);
    std::thread runner([&] { rc.start(); });
    rc.wait_ready();

    auto sessions = rc.live_sessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions.count("down"), 0u);

    rc.close_pipe();
    runner.join();

    EXPECT_EQ(transport->session("down:22"), nullptr);
    auto events = transport->session("up:22")->events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1], "signal:TERM");
    EXPECT_EQ(events[2], "close");

    auto errors = rc.errors();
    EXPECT_EQ(errors["down"], "dial tcp down:22: connection refused");
    EXPECT_EQ(errors["up"], "Process exited with status -1 from signal TERM");
}

TEST_F(RemoteCommandTest, ClosePipeWithoutSessionsIsNoop) {
    RemoteCommand rc({"h"}, "true", stream_opts(), transport);
    rc.close_pipe();
    EXPECT_TRUE(rc.live_sessions().empty());
    EXPECT_TRUE(transport->dialed().empty());
}

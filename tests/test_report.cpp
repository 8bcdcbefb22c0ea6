#include <gtest/gtest.h>
#include <fleet/report.hpp>
#include <fleet/remote_command.hpp>
#include "fake_transport.hpp"
#include <sstream>

// gzip of "ok\n"
static const unsigned char GZ_OK[] = {
    0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x02, 0x03, 0xcb, 0xcf,
    0xe6, 0x02, 0x00, 0x7d, 0x0e, 0x16, 0xda, 0x03, 0x00, 0x00, 0x00,
};

class ReportTest : public ::testing::Test {
protected:
    std::ostringstream err;
    std::ostringstream out;
    ReportOptions options;

    void render(const std::unordered_map<std::string, std::string>& errors,
                const std::unordered_map<std::string, std::string>& outputs) {
        render_report(errors, outputs, err, out, options);
    }
};

TEST_F(ReportTest, SingleLineOutputRightAlignsHost) {
    options.no_header = true;
    render({}, {{"h1", "hello\n"}});

    EXPECT_EQ(out.str(), "             h1: hello\n");
    EXPECT_EQ(err.str(), "");
}

TEST_F(ReportTest, MultiLineOutputStartsOnNextLine) {
    options.no_header = true;
    render({}, {{"h2", "line1\nline2\n\n"}});

    EXPECT_EQ(out.str(), "             h2: \nline1\nline2\n");
}

TEST_F(ReportTest, LongHostNameIsNotTruncated) {
    options.no_header = true;
    render({}, {{"very-long-hostname.example.com", "x"}});

    EXPECT_EQ(out.str(), "very-long-hostname.example.com: x\n");
}

TEST_F(ReportTest, NoHostPrintsBodyOnly) {
    options.no_header = true;
    options.no_host = true;
    render({}, {{"h1", "hello\n"}});

    EXPECT_EQ(out.str(), "hello\n");
}

TEST_F(ReportTest, NoHostSuppressesErrors) {
    options.no_host = true;
    render({{"h1", "dial tcp h1:22: connection refused"}}, {});

    EXPECT_EQ(err.str(), "");
    EXPECT_EQ(out.str(), "");
}

TEST_F(ReportTest, HeadersPrintedPerNonEmptySection) {
    render({{"bad", "oops"}}, {{"good", "fine"}});

    EXPECT_EQ(err.str(),
              "================================= ERROR =================================\n"
              "bad : oops\n");
    EXPECT_EQ(out.str(),
              "================================= OUTPUT =================================\n"
              "           good: fine\n");
}

TEST_F(ReportTest, EmptyMapsPrintNothing) {
    render({}, {});

    EXPECT_EQ(err.str(), "");
    EXPECT_EQ(out.str(), "");
}

TEST_F(ReportTest, MultiLineErrorIndented) {
    options.no_header = true;
    render({{"h", "Process exited with status 1\nno such file\n"}}, {});

    EXPECT_EQ(err.str(), "h :\n Process exited with status 1\nno such file\n");
}

TEST_F(ReportTest, GzipOutputDecompressed) {
    options.no_header = true;
    options.gzip = true;
    render({}, {{"h", std::string(reinterpret_cast<const char*>(GZ_OK), sizeof(GZ_OK))}});

    EXPECT_EQ(out.str(), "              h: ok\n");
}

TEST_F(ReportTest, CorruptGzipHostSkipped) {
    options.no_header = true;
    options.gzip = true;
    render({}, {{"bad", "definitely not gzip"}});

    // Header of the section is still suppressed; the host itself is skipped
    EXPECT_EQ(out.str(), "");
}

TEST_F(ReportTest, PrintReportUsesCommandState) {
    auto transport = std::make_shared<FakeTransport>();
    FakeHost up;
    up.result = SSHResult{0, "up 3 days\n", "", ""};
    FakeHost down;
    down.dial_error = "dial tcp down:22: i/o timeout";
    transport->add("up:22", up);
    transport->add("down:22", down);

    RemoteCommand rc({"up", "down"}, "uptime", CommandOptions{}, transport);
    ASSERT_TRUE(rc.start().is_ok());

    print_report(rc, err, out, false, false);
    EXPECT_EQ(err.str(),
              "================================= ERROR =================================\n"
              "down : dial tcp down:22: i/o timeout\n");
    EXPECT_EQ(out.str(),
              "================================= OUTPUT =================================\n"
              "             up: up 3 days\n");
}

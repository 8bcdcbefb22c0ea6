#include "report.hpp"
#include "remote_command.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/gzip.hpp>
#include <fmt/format.h>
#include <stdexcept>

static void render_errors(const std::unordered_map<std::string, std::string>& errors,
                          std::ostream& err, const ReportOptions& options) {
    if (errors.empty() || options.no_host) return;

    if (!options.no_header) {
        err << REPORT_ERROR_HEADER << "\n";
    }
    for (const auto& [host, message] : errors) {
        std::string e = trim_trailing_newlines(message);
        if (e.find('\n') != std::string::npos) {
            err << host << " :\n " << e << "\n";
        } else {
            err << host << " : " << e << "\n";
        }
    }
}

static void render_outputs(const std::unordered_map<std::string, std::string>& outputs,
                           std::ostream& out, const ReportOptions& options) {
    if (outputs.empty()) return;

    if (!options.no_header) {
        out << REPORT_OUTPUT_HEADER << "\n";
    }
    for (const auto& [host, payload] : outputs) {
        std::string body;
        if (options.gzip) {
            try {
                body = platform::gunzip(payload);
            } catch (const std::runtime_error& e) {
                fleet_log(fmt::format("{}: cannot decompress output: {}", host, e.what()));
                continue;
            }
        } else {
            body = payload;
        }

        body = trim_trailing_newlines(body);
        if (!options.no_host) {
            out << fmt::format("{:>{}}: ", host, REPORT_HOST_WIDTH);
            if (body.find('\n') != std::string::npos) {
                out << "\n";
            }
        }
        out << body << "\n";
    }
}

void render_report(const std::unordered_map<std::string, std::string>& errors,
                   const std::unordered_map<std::string, std::string>& outputs,
                   std::ostream& err, std::ostream& out,
                   const ReportOptions& options) {
    render_errors(errors, err, options);
    render_outputs(outputs, out, options);
    err.flush();
    out.flush();
}

void print_report(const RemoteCommand& rc, std::ostream& err, std::ostream& out,
                  bool no_header, bool no_host) {
    ReportOptions options;
    options.no_header = no_header;
    options.no_host = no_host;
    options.gzip = rc.gzip();
    render_report(rc.errors(), rc.outputs(), err, out, options);
}

#pragma once

#include <ostream>
#include <string>
#include <unordered_map>

class RemoteCommand;

struct ReportOptions {
    bool no_header = false;  // skip the ===== ERROR / OUTPUT ===== banners
    bool no_host = false;    // skip host labels (and the error section)
    bool gzip = false;       // outputs are gzip streams
};

// Render errors to err and outputs to out.
//
// Errors:  "host : message"            (single line)
//          "host :\n message"          (multi-line message)
// Outputs: "{:>15}: body"              (single line)
//          "{:>15}: \nline1\nline2"    (multi-line body)
// Trailing newlines are trimmed and exactly one is written after each entry.
// A gzip payload that fails to decompress is logged and its host skipped.
// Host order within a section is unspecified.
void render_report(const std::unordered_map<std::string, std::string>& errors,
                   const std::unordered_map<std::string, std::string>& outputs,
                   std::ostream& err, std::ostream& out,
                   const ReportOptions& options);

// Render a finished (or in-flight) RemoteCommand; gzip follows the command.
void print_report(const RemoteCommand& rc, std::ostream& err, std::ostream& out,
                  bool no_header, bool no_host);

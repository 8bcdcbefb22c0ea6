#include "gzip.hpp"
#include <core/constants.hpp>
#include <archive.h>
#include <archive_entry.h>
#include <stdexcept>
#include <vector>

namespace platform {

static std::string archive_error(struct archive* a, const char* fallback) {
    const char* err = archive_error_string(a);
    return err ? std::string(err) : std::string(fallback);
}

std::string gunzip(const std::string& data) {
    struct archive* a = archive_read_new();
    if (!a) throw std::runtime_error("Failed to create archive reader");

    // Raw format: the payload is a bare gzip member, not a tar
    archive_read_support_filter_gzip(a);
    archive_read_support_format_raw(a);
    archive_read_support_format_empty(a);

    if (archive_read_open_memory(a, data.data(), data.size()) != ARCHIVE_OK) {
        std::string err = archive_error(a, "cannot open input");
        archive_read_free(a);
        throw std::runtime_error("gzip: " + err);
    }

    // Without a gzip filter libarchive would pass the bytes through untouched
    if (archive_filter_code(a, 0) != ARCHIVE_FILTER_GZIP) {
        archive_read_free(a);
        throw std::runtime_error("gzip: invalid header");
    }

    struct archive_entry* entry = nullptr;
    int rc = archive_read_next_header(a, &entry);
    if (rc == ARCHIVE_EOF) {
        archive_read_free(a);
        return "";
    }
    if (rc != ARCHIVE_OK && rc != ARCHIVE_WARN) {
        std::string err = archive_error(a, "cannot read header");
        archive_read_free(a);
        throw std::runtime_error("gzip: " + err);
    }

    std::string out;
    std::vector<char> buf(GZIP_READ_BUF_SIZE);
    while (true) {
        la_ssize_t n = archive_read_data(a, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            std::string err = archive_error(a, "corrupt stream");
            archive_read_free(a);
            throw std::runtime_error("gzip: " + err);
        }
        out.append(buf.data(), static_cast<size_t>(n));
    }

    archive_read_free(a);
    return out;
}

} // namespace platform

#pragma once

#include <string>

namespace platform {

// Decompress a complete in-memory gzip stream.
// Throws std::runtime_error if the data is not gzip or is truncated/corrupt.
std::string gunzip(const std::string& data);

} // namespace platform

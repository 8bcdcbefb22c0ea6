#pragma once

#include <filesystem>

namespace platform {

// $HOME, or the temp directory when HOME is unset.
std::filesystem::path home_dir();

std::filesystem::path temp_dir();

void sleep_ms(int ms);

} // namespace platform

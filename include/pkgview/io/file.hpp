#pragma once

#include <filesystem>
#include <string>

#include "pkgview/error.hpp"


namespace pkgview::io {

// Loads a whole file into `out`.
// On failure `out` is untouched and `err` holds an error_code::file_read.
[[nodiscard]]
bool read_file(const std::filesystem::path& path, std::string& out, error& err);

} // namespace pkgview::io

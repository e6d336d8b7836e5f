#include "pkgview/io/file.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include "lcr/log/logger.hpp"


namespace pkgview::io {

namespace {

[[nodiscard]]
bool fail(const std::filesystem::path& path, const std::string& reason, error& err) {
    err = error{error_code::file_read, "Failed to read " + path.string() + ": " + reason};
    PV_DEBUG("[IO] " << err.message);
    return false;
}

} // namespace


bool read_file(const std::filesystem::path& path, std::string& out, error& err) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return fail(path, "No such file or directory", err);
    }
    if (ec) {
        return fail(path, ec.message(), err);
    }
    if (status.type() == std::filesystem::file_type::directory) {
        return fail(path, "Is a directory", err);
    }

    errno = 0;
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        return fail(path, errno != 0 ? std::strerror(errno) : "cannot open file", err);
    }

    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return fail(path, "I/O error while reading", err);
    }

    PV_DEBUG("[IO] Read " << content.size() << " byte(s) from " << path.string());
    out = std::move(content);
    return true;
}

} // namespace pkgview::io

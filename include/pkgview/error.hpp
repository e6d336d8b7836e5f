#pragma once

#include <string>
#include <string_view>

namespace pkgview {

/*
===============================================================================
Error Model
===============================================================================

Every failure that ends a run is reported as one `error`.

[file_read] the manifest path does not exist, is not a regular file, or cannot
be read (permissions, I/O error). Nothing was parsed.

[parse] the manifest text is not well-formed XML, or a <types> block has no
usable <name>. The message carries the position (line / column) or the block
index. Nothing was rendered.

[invalid_option] a command-line value is outside its allowed set (format, sort,
log level). The message lists the accepted values.

[io_failure] the rendered output could not be written to stdout. The run is
not retried.

Exactly one error is reported per failed run; no partial output precedes it.
===============================================================================
*/

enum class error_code {
    file_read,
    parse,
    invalid_option,
    io_failure
};

constexpr std::string_view to_string(error_code c) noexcept {
    switch (c) {
        case error_code::file_read:      return "file_read";
        case error_code::parse:          return "parse";
        case error_code::invalid_option: return "invalid_option";
        case error_code::io_failure:     return "io_failure";
    }
    return "unknown";
}

struct error {
    error_code code;
    std::string message; // Human-readable explanation
};

} // namespace pkgview

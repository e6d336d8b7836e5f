#pragma once

#include <string_view>

#include "pkgview/manifest/manifest.hpp"
#include "pkgview/manifest/parser/result.hpp"

/*
================================================================================
package.xml Parser
================================================================================

Turns manifest text into a Manifest:

    <Package xmlns="http://soap.sforce.com/2006/04/metadata">
        <types>
            <members>AccountHandler</members>
            <members>ContactService</members>
            <name>ApexClass</name>
        </types>
        <version>60.0</version>
    </Package>

  -> { ApexClass/AccountHandler, ApexClass/ContactService }, version "60.0"

Rules:
  • Components come out in document order (blocks, then members in a block)
  • Duplicates are preserved
  • <members> may appear before or after <name>; a block is resolved when it
    closes
  • A block with no <members> contributes nothing
  • Namespace mismatch is reported as a warning, never as an error
  • The root element name is not checked; unknown elements are ignored

On any failure `out` is left untouched and `error` describes the cause.
================================================================================
*/

namespace pkgview::manifest::parser {

struct package {

    [[nodiscard]]
    static Result parse(std::string_view xml, Manifest& out, Error& error);

};

} // namespace pkgview::manifest::parser

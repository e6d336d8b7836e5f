#include <iostream>
#include <string>
#include <string_view>

#include "pkgview/manifest/parser.hpp"

#include "common/manifests.hpp"
#include "common/test_check.hpp"

using namespace pkgview::manifest;

/*
================================================================================
package.xml Parser - Unit Tests
================================================================================

Covers:
  • Document order of components (blocks, then members)
  • <members> before / after <name>, empty blocks, duplicates
  • Optional <version>
  • Advisory namespace handling (missing, foreign, prefixed)
  • Text decoding (entities, CDATA, surrounding whitespace)
  • Invalid UTF-8 and text outside the root rejected as MalformedXml
  • MalformedXml / MissingTypeName / DuplicateTypeName and their detail
  • Output left untouched on failure
================================================================================
*/

namespace {

parser::Result parse(std::string_view xml, Manifest& m, parser::Error& err) {
    return parser::package::parse(xml, m, err);
}

} // namespace

// ============================================================================
// SUCCESS CASES
// ============================================================================

void test_document_order() {
    std::cout << "[TEST] Components in document order..." << std::endl;

    Manifest m;
    parser::Error err;
    TEST_CHECK(parser::package::parse(tests::manifests::APEX, m, err) == parser::Result::Parsed);

    TEST_CHECK(m.components.size() == 3);
    TEST_CHECK(m.components[0] == Component("ApexClass", "AccountHandler"));
    TEST_CHECK(m.components[1] == Component("ApexClass", "ContactService"));
    TEST_CHECK(m.components[2] == Component("ApexTrigger", "AccountTrigger"));
    TEST_CHECK(m.type_blocks == 2);
    TEST_CHECK(m.version.has_value());
    TEST_CHECK(*m.version == "60.0");
    TEST_CHECK(m.namespace_matches);

    std::cout << "[TEST] OK\n";
}

void test_name_before_members() {
    std::cout << "[TEST] <name> before and between <members>..." << std::endl;

    constexpr std::string_view xml = R"xml(
    <Package xmlns="http://soap.sforce.com/2006/04/metadata">
        <types>
            <members>First</members>
            <name>ApexPage</name>
            <members>Second</members>
        </types>
        <types>
            <name>StaticResource</name>
            <members>Logo</members>
        </types>
    </Package>
    )xml";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::Parsed);
    TEST_CHECK(m.components.size() == 3);
    TEST_CHECK(m.components[0] == Component("ApexPage", "First"));
    TEST_CHECK(m.components[1] == Component("ApexPage", "Second"));
    TEST_CHECK(m.components[2] == Component("StaticResource", "Logo"));

    std::cout << "[TEST] OK\n";
}

void test_empty_package() {
    std::cout << "[TEST] Package without <types>..." << std::endl;

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(tests::manifests::EMPTY_PACKAGE, m, err) == parser::Result::Parsed);
    TEST_CHECK(m.components.empty());
    TEST_CHECK(m.type_blocks == 0);

    std::cout << "[TEST] OK\n";
}

void test_types_without_members() {
    std::cout << "[TEST] <types> block with no members..." << std::endl;

    constexpr std::string_view xml = R"xml(
    <Package xmlns="http://soap.sforce.com/2006/04/metadata">
        <types>
            <name>ApexClass</name>
        </types>
        <types>
            <members>Account</members>
            <name>CustomObject</name>
        </types>
    </Package>
    )xml";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::Parsed);
    TEST_CHECK(m.type_blocks == 2);
    TEST_CHECK(m.components.size() == 1);
    TEST_CHECK(m.components[0] == Component("CustomObject", "Account"));
    TEST_CHECK(!m.version.has_value());

    std::cout << "[TEST] OK\n";
}

void test_duplicates_preserved() {
    std::cout << "[TEST] Duplicate members and blocks kept..." << std::endl;

    constexpr std::string_view xml = R"xml(
    <Package xmlns="http://soap.sforce.com/2006/04/metadata">
        <types>
            <members>Dup</members>
            <members>Dup</members>
            <name>ApexClass</name>
        </types>
        <types>
            <members>Dup</members>
            <name>ApexClass</name>
        </types>
    </Package>
    )xml";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::Parsed);
    TEST_CHECK(m.components.size() == 3);
    for (const auto& c : m.components) {
        TEST_CHECK(c == Component("ApexClass", "Dup"));
    }

    std::cout << "[TEST] OK\n";
}

void test_text_decoding() {
    std::cout << "[TEST] Entities, CDATA and whitespace..." << std::endl;

    constexpr std::string_view xml = R"xml(
    <Package xmlns="http://soap.sforce.com/2006/04/metadata">
        <types>
            <members>Foo &amp; Bar</members>
            <members><![CDATA[Foo, Bar]]></members>
            <members>
                Padded
            </members>
            <name> ApexClass </name>
        </types>
        <fullName>ignored</fullName>
    </Package>
    )xml";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::Parsed);
    TEST_CHECK(m.components.size() == 3);
    TEST_CHECK(m.components[0].member_name == "Foo & Bar");
    TEST_CHECK(m.components[1].member_name == "Foo, Bar");
    TEST_CHECK(m.components[2].member_name == "Padded");
    TEST_CHECK(m.components[2].type_name == "ApexClass");

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// NAMESPACES (advisory)
// ============================================================================

void test_missing_namespace_is_tolerated() {
    std::cout << "[TEST] Missing namespace..." << std::endl;

    constexpr std::string_view xml = R"xml(
    <Package>
        <types><members>A</members><name>ApexClass</name></types>
    </Package>
    )xml";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::Parsed);
    TEST_CHECK(!m.namespace_matches);
    TEST_CHECK(m.components.size() == 1);

    std::cout << "[TEST] OK\n";
}

void test_foreign_namespace_is_tolerated() {
    std::cout << "[TEST] Foreign namespace..." << std::endl;

    constexpr std::string_view xml = R"xml(
    <Package xmlns="urn:example:other">
        <types><members>A</members><name>ApexClass</name></types>
    </Package>
    )xml";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::Parsed);
    TEST_CHECK(!m.namespace_matches);
    TEST_CHECK(m.components.size() == 1);

    std::cout << "[TEST] OK\n";
}

void test_prefixed_namespace() {
    std::cout << "[TEST] Prefixed namespace..." << std::endl;

    constexpr std::string_view xml = R"xml(
    <md:Package xmlns:md="http://soap.sforce.com/2006/04/metadata">
        <md:types>
            <md:members>A</md:members>
            <md:name>ApexClass</md:name>
        </md:types>
        <md:version>59.0</md:version>
    </md:Package>
    )xml";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::Parsed);
    TEST_CHECK(m.namespace_matches);
    TEST_CHECK(m.components.size() == 1);
    TEST_CHECK(m.components[0] == Component("ApexClass", "A"));
    TEST_CHECK(m.version.has_value() && *m.version == "59.0");

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// FAILURE CASES
// ============================================================================

void test_missing_type_name() {
    std::cout << "[TEST] <types> without <name>..." << std::endl;

    constexpr std::string_view xml = R"xml(
    <Package xmlns="http://soap.sforce.com/2006/04/metadata">
        <types><members>A</members><name>ApexClass</name></types>
        <types><members>X</members></types>
    </Package>
    )xml";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::MissingTypeName);
    TEST_CHECK(err.code == parser::Result::MissingTypeName);
    TEST_CHECK(err.block_index == 1);
    TEST_CHECK(m.components.empty());
    TEST_CHECK(parser::describe(err).find("block #1") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_empty_type_name() {
    std::cout << "[TEST] <types> with blank <name>..." << std::endl;

    constexpr std::string_view xml = R"xml(
    <Package xmlns="http://soap.sforce.com/2006/04/metadata">
        <types><members>X</members><name>   </name></types>
    </Package>
    )xml";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::MissingTypeName);
    TEST_CHECK(err.block_index == 0);

    std::cout << "[TEST] OK\n";
}

void test_duplicate_type_name() {
    std::cout << "[TEST] <types> with two <name>..." << std::endl;

    constexpr std::string_view xml = R"xml(
    <Package xmlns="http://soap.sforce.com/2006/04/metadata">
        <types><members>X</members><name>ApexClass</name><name>ApexPage</name></types>
    </Package>
    )xml";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::DuplicateTypeName);
    TEST_CHECK(err.block_index == 0);

    std::cout << "[TEST] OK\n";
}

void test_unclosed_tag() {
    std::cout << "[TEST] Unclosed element..." << std::endl;

    constexpr std::string_view xml =
        "<Package xmlns=\"http://soap.sforce.com/2006/04/metadata\">\n"
        "    <types>\n"
        "        <members>A</members>\n"
        "        <name>ApexClass</name>\n";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::MalformedXml);
    TEST_CHECK(err.code == parser::Result::MalformedXml);
    TEST_CHECK(err.line >= 1);
    TEST_CHECK(err.column >= 1);
    TEST_CHECK(!err.detail.empty());
    TEST_CHECK(parser::describe(err).find("line") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_mismatched_tag_position() {
    std::cout << "[TEST] Mismatched end tag reports its line..." << std::endl;

    constexpr std::string_view xml =
        "<Package>\n"
        "  <types>\n"
        "    <members>A</member>\n"
        "  </types>\n"
        "</Package>\n";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::MalformedXml);
    TEST_CHECK(err.line == 3);

    std::cout << "[TEST] OK\n";
}

void test_empty_input() {
    std::cout << "[TEST] Empty input..." << std::endl;

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse("", m, err) == parser::Result::MalformedXml);
    TEST_CHECK(parse("   \n  ", m, err) == parser::Result::MalformedXml);

    std::cout << "[TEST] OK\n";
}

void test_multiple_roots() {
    std::cout << "[TEST] Two root elements..." << std::endl;

    constexpr std::string_view xml = "<Package></Package>\n<Package></Package>";

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::MalformedXml);
    TEST_CHECK(err.line == 2);

    std::cout << "[TEST] OK\n";
}

void test_invalid_utf8() {
    std::cout << "[TEST] Invalid UTF-8 byte..." << std::endl;

    {
        // 0xFF never appears in UTF-8; it sits at offset 25 on line 1
        constexpr std::string_view xml =
            "<Package><types><members>\xFF" "bad</members><name>ApexClass</name></types></Package>";

        Manifest m;
        m.components.emplace_back("Keep", "Me");
        parser::Error err;
        TEST_CHECK(parse(xml, m, err) == parser::Result::MalformedXml);
        TEST_CHECK(err.offset == 25);
        TEST_CHECK(err.line == 1);
        TEST_CHECK(err.column == 26);
        TEST_CHECK(err.detail == "Invalid UTF-8 sequence");
        TEST_CHECK(m.components.size() == 1);
    }
    {
        // Truncated two-byte sequence on line 2
        constexpr std::string_view xml =
            "<Package>\n"
            "<types><members>Caf\xC3</members><name>ApexClass</name></types>\n"
            "</Package>\n";

        Manifest m;
        parser::Error err;
        TEST_CHECK(parse(xml, m, err) == parser::Result::MalformedXml);
        TEST_CHECK(err.line == 2);
        TEST_CHECK(err.column == 20);
    }
    {
        // Overlong encoding of '/' and an encoded surrogate
        Manifest m;
        parser::Error err;
        TEST_CHECK(parse("<Package><version>\xC0\xAF</version></Package>", m, err) == parser::Result::MalformedXml);
        TEST_CHECK(parse("<Package><version>\xED\xA0\x80</version></Package>", m, err) == parser::Result::MalformedXml);
    }
    {
        // Well-formed multi-byte text still parses
        constexpr std::string_view xml =
            "<Package><types><members>Caf\xC3\xA9_\xE2\x82\xAC_\xF0\x9F\x98\x80</members>"
            "<name>ApexClass</name></types></Package>";

        Manifest m;
        parser::Error err;
        TEST_CHECK(parse(xml, m, err) == parser::Result::Parsed);
        TEST_CHECK(m.components.size() == 1);
        TEST_CHECK(m.components[0].member_name == "Caf\xC3\xA9_\xE2\x82\xAC_\xF0\x9F\x98\x80");
    }

    std::cout << "[TEST] OK\n";
}

void test_text_outside_root() {
    std::cout << "[TEST] Text outside the root element..." << std::endl;

    {
        Manifest m;
        parser::Error err;
        TEST_CHECK(parse("junk<Package></Package>", m, err) == parser::Result::MalformedXml);
        TEST_CHECK(err.detail == "Text outside the root element");
        TEST_CHECK(err.line == 1);
        TEST_CHECK(err.column == 1);
    }
    {
        Manifest m;
        parser::Error err;
        TEST_CHECK(parse("<Package></Package>\ntrailing text\n", m, err) == parser::Result::MalformedXml);
        TEST_CHECK(err.detail == "Text outside the root element");
        TEST_CHECK(err.line == 2);
    }
    {
        // Whitespace, comments and a declaration around the root are fine
        constexpr std::string_view xml =
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            "<!-- generated -->\n"
            "<Package><types><members>A</members><name>ApexClass</name></types></Package>\n"
            "\n";

        Manifest m;
        parser::Error err;
        TEST_CHECK(parse(xml, m, err) == parser::Result::Parsed);
        TEST_CHECK(m.components.size() == 1);
    }

    std::cout << "[TEST] OK\n";
}

void test_transcoded_input_position() {
    std::cout << "[TEST] Error position in transcoded input..." << std::endl;

    // UTF-16LE (BOM) with an unclosed element: the offset indexes the
    // decoded text, so no line / column is claimed
    std::string xml = "\xFF\xFE";
    for (char c : std::string_view("<Package><types>")) {
        xml.push_back(c);
        xml.push_back('\0');
    }

    Manifest m;
    parser::Error err;
    TEST_CHECK(parse(xml, m, err) == parser::Result::MalformedXml);
    TEST_CHECK(err.line == 0);
    TEST_CHECK(err.column == 0);
    TEST_CHECK(parser::describe(err).find("line") == std::string::npos);
    TEST_CHECK(parser::describe(err).find("decoded") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_output_untouched_on_failure() {
    std::cout << "[TEST] Output untouched on failure..." << std::endl;

    Manifest m;
    m.components.emplace_back("Keep", "Me");
    m.version = "1.0";

    parser::Error err;
    TEST_CHECK(parse("<Package><types>", m, err) != parser::Result::Parsed);
    TEST_CHECK(m.components.size() == 1);
    TEST_CHECK(m.components[0] == Component("Keep", "Me"));
    TEST_CHECK(*m.version == "1.0");

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    // Success
    test_document_order();
    test_name_before_members();
    test_empty_package();
    test_types_without_members();
    test_duplicates_preserved();
    test_text_decoding();

    // Namespaces
    test_missing_namespace_is_tolerated();
    test_foreign_namespace_is_tolerated();
    test_prefixed_namespace();

    // Failure
    test_missing_type_name();
    test_empty_type_name();
    test_duplicate_type_name();
    test_unclosed_tag();
    test_mismatched_tag_position();
    test_empty_input();
    test_multiple_roots();
    test_invalid_utf8();
    test_text_outside_root();
    test_transcoded_input_position();
    test_output_untouched_on_failure();

    std::cout << "[TEST] ALL MANIFEST PARSER TESTS PASSED!\n";
    return 0;
}

#include <doctest/doctest.h>

#include "bif6/fileheader.hpp"
#include "bif6/fileutils.hpp"
#include "helpers/bif6_builder.hpp"

#include <sstream>
#include <string>

namespace {

bif6::FileHeader parseHeader(const std::string& bytes) {
    std::istringstream in(bytes);
    bif6::FileHeader header;
    header.read(in);
    return header;
}

void checkHeaderError(const std::string& bytes, bif6::FormatError::Kind kind,
                      uint64_t offset) {
    try {
        parseHeader(bytes);
        FAIL("expected a format error");
    } catch (bif6::FormatError& e) {
        CHECK(e.kind() == kind);
        CHECK(e.record() == bif6::FormatError::HEADER);
        CHECK(e.offset() == offset);
    }
}

} // namespace

TEST_CASE("Little-endian field decoding") {
    SUBCASE("16-bit") {
        CHECK(bif6::read_le16("\x34\x12") == 0x1234);
        CHECK(bif6::read_le16("\xff\xfe") == 0xfeff);
    }

    SUBCASE("32-bit") {
        CHECK(bif6::read_le32("\x78\x56\x34\x12") == 0x12345678u);
        CHECK(bif6::read_le32("\xef\xbe\xad\xde") == 0xdeadbeefu);
    }

    SUBCASE("float") {
        CHECK(bif6::read_le_float(std::string("\x00\x00\xc0\x3f", 4).data()) == 1.5f);
        CHECK(bif6::read_le_float(std::string("\x00\x00\x00\xc0", 4).data()) == -2.0f);
    }
}

TEST_CASE("BIF6 header: valid") {
    SUBCASE("synthetic") {
        test_helpers::Bif6Builder builder(3, 2);
        builder.intervalCount(5);
        auto header = parseHeader(builder.header());
        CHECK(header.interval_count == 5);
        CHECK(header.width == 3);
        CHECK(header.height == 2);
        CHECK(header.pixelCount() == 6);
    }

    SUBCASE("known bytes") {
        auto header = parseHeader(std::string("\0\0BIF6\x34\x12\x02\x01\x01\x00", 12));
        CHECK(header.interval_count == 0x1234);
        CHECK(header.width == 258);
        CHECK(header.height == 1);
    }

    SUBCASE("stream is left at the first record") {
        std::istringstream in(std::string("\0\0BIF6\x01\x00\x01\x00\x01\x00XYZ", 15));
        bif6::FileHeader header;
        header.read(in);
        CHECK(in.get() == 'X');
    }
}

TEST_CASE("BIF6 header: errors") {
    SUBCASE("wrong magic") {
        checkHeaderError(std::string("\0\0BIF5\x01\x00\x01\x00\x01\x00", 12),
                         bif6::FormatError::InvalidMagic, 0);
    }

    SUBCASE("not a BIF6 file at all") {
        checkHeaderError("\x89PNG\r\n\x1a\n....", bif6::FormatError::InvalidMagic, 0);
    }

    SUBCASE("empty") {
        checkHeaderError("", bif6::FormatError::Truncated, 0);
    }

    SUBCASE("shorter than the magic") {
        checkHeaderError(std::string("\0\0B", 3), bif6::FormatError::Truncated, 0);
    }

    SUBCASE("magic followed by an incomplete header") {
        checkHeaderError(std::string("\0\0BIF6\x01\x00", 8), bif6::FormatError::Truncated, 8);
    }
}

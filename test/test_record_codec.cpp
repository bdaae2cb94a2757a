#include <doctest/doctest.h>

#include "bif6/record.hpp"
#include "helpers/bif6_builder.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace {

std::string metadata(uint32_t id, float lower, float middle, float upper) {
    std::string out;
    test_helpers::put_le32(out, id);
    test_helpers::put_le_float(out, lower);
    test_helpers::put_le_float(out, middle);
    test_helpers::put_le_float(out, upper);
    return out;
}

const bif6::Location where{100, 2};

} // namespace

TEST_CASE("Record codec: sizes") {
    bif6::RecordCodec codec(3, 2);
    CHECK(codec.metadataSize() == 16);
    CHECK(codec.payloadSize() == 24);
    CHECK(codec.recordSize() == 40);
}

TEST_CASE("Record codec: metadata") {
    bif6::RecordCodec codec(2, 2);
    sims::IntervalImage interval;

    SUBCASE("fields are decoded in order") {
        auto buf = metadata(7, 100.5f, 101.0f, 101.5f);
        codec.decodeMetadata(buf.data(), where, interval);
        CHECK(interval.id == 7);
        CHECK(interval.mz_lower == 100.5);
        CHECK(interval.mz_middle == 101.0);
        CHECK(interval.mz_upper == 101.5);
    }

    SUBCASE("known bytes") {
        std::string buf("\x2a\x00\x00\x00"
                        "\x00\x00\xc0\x3f"
                        "\x00\x00\x00\x40"
                        "\x00\x00\x20\x40", 16);
        codec.decodeMetadata(buf.data(), where, interval);
        CHECK(interval.id == 42);
        CHECK(interval.mz_lower == 1.5);
        CHECK(interval.mz_middle == 2.0);
        CHECK(interval.mz_upper == 2.5);
    }

    SUBCASE("single-value band is accepted") {
        auto buf = metadata(1, 55.0f, 55.0f, 55.0f);
        codec.decodeMetadata(buf.data(), where, interval);
        CHECK(interval.mz_lower == interval.mz_upper);
    }

    SUBCASE("float32 values are widened exactly") {
        float lower = 123.456f;
        auto buf = metadata(1, lower, 200.1f, 300.7f);
        codec.decodeMetadata(buf.data(), where, interval);
        CHECK(interval.mz_lower == double(lower));
    }
}

TEST_CASE("Record codec: m/z ordering violations") {
    bif6::RecordCodec codec(2, 2);
    sims::IntervalImage interval;
    const float nan = std::numeric_limits<float>::quiet_NaN();

    std::string buf;
    SUBCASE("lower above middle") { buf = metadata(1, 10.0f, 9.0f, 11.0f); }
    SUBCASE("middle above upper") { buf = metadata(1, 10.0f, 12.0f, 11.0f); }
    SUBCASE("reversed") { buf = metadata(1, 12.0f, 11.0f, 10.0f); }
    SUBCASE("NaN") { buf = metadata(1, 10.0f, nan, 11.0f); }

    try {
        codec.decodeMetadata(buf.data(), where, interval);
        FAIL("expected InvalidRange");
    } catch (bif6::FormatError& e) {
        CHECK(e.kind() == bif6::FormatError::InvalidRange);
        CHECK(e.record() == 2);
        CHECK(e.offset() == 104);
    }
}

TEST_CASE("Record codec: dimensions") {
    sims::IntervalImage interval;
    auto buf = metadata(1, 1.0f, 2.0f, 3.0f);

    SUBCASE("zero width") {
        bif6::RecordCodec codec(0, 4);
        CHECK_THROWS_AS(codec.decodeMetadata(buf.data(), where, interval), bif6::FormatError);
    }

    SUBCASE("zero height") {
        bif6::RecordCodec codec(4, 0);
        try {
            codec.decodeMetadata(buf.data(), where, interval);
            FAIL("expected InvalidDimensions");
        } catch (bif6::FormatError& e) {
            CHECK(e.kind() == bif6::FormatError::InvalidDimensions);
            CHECK(e.offset() == 100);
        }
    }

    SUBCASE("above the default limit") {
        bif6::RecordCodec codec(9000, 1);
        CHECK_THROWS_AS(codec.checkDimensions(where), bif6::FormatError);
    }

    SUBCASE("configured limit") {
        bif6::ReaderSettings settings;
        settings.max_dimension = 4;
        CHECK_NOTHROW(bif6::RecordCodec(4, 4, settings).checkDimensions(where));
        CHECK_THROWS_AS(bif6::RecordCodec(4, 5, settings).checkDimensions(where),
                        bif6::FormatError);
    }

    SUBCASE("the range check comes first") {
        bif6::RecordCodec codec(0, 0);
        auto bad = metadata(1, 3.0f, 2.0f, 1.0f);
        try {
            codec.decodeMetadata(bad.data(), where, interval);
            FAIL("expected InvalidRange");
        } catch (bif6::FormatError& e) {
            CHECK(e.kind() == bif6::FormatError::InvalidRange);
        }
    }
}

TEST_CASE("Record codec: pixels") {
    bif6::RecordCodec codec(2, 2);
    std::string buf;
    test_helpers::put_le32(buf, 1);
    test_helpers::put_le32(buf, 0xdeadbeef);
    test_helpers::put_le32(buf, 3);
    test_helpers::put_le32(buf, 4);

    sims::ImageU32 image;
    codec.decodePixels(buf.data(), image);
    REQUIRE(image.height() == 2);
    REQUIRE(image.width() == 2);
    CHECK(image.intensity(0, 0) == 1);
    CHECK(image.intensity(0, 1) == 0xdeadbeefu);
    CHECK(image.intensity(1, 0) == 3);
    CHECK(image.intensity(1, 1) == 4);
}

TEST_CASE("Record codec: non-square raster is height rows of width samples") {
    bif6::RecordCodec codec(3, 1);
    std::string buf;
    for (uint32_t i = 0; i < 3; ++i)
        test_helpers::put_le32(buf, 10 + i);

    sims::ImageU32 image;
    codec.decodePixels(buf.data(), image);
    CHECK(image.height() == 1);
    CHECK(image.width() == 3);
    CHECK(image.intensity(0, 2) == 12);
}

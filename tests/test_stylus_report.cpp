#include "stylus_report.hpp"

#include <gtest/gtest.h>
#include <vector>

namespace {

std::vector<uint8_t> report(uint8_t status, uint8_t tilt_x = 0, uint8_t tilt_y = 0) {
    return {0x07, status, 0x34, 0x12, 0x78, 0x56, 0xff, 0x3f, tilt_x, tilt_y};
}

} // namespace

TEST(StylusReport, DecodesTipInRangeScenario) {
    std::vector<uint8_t> payload = {0x07, 0x09, 0x00, 0x00, 0x64, 0x00, 0x00, 0x20, 0x00, 0x00,
                                    0x00, 0x00};
    auto sample = decode_stylus_report(payload.data(), payload.size());
    ASSERT_TRUE(sample.has_value());

    StylusSample expected;
    expected.tip = true;
    expected.in_range = true;
    expected.x = 0;
    expected.y = 100;
    expected.pressure = 8192;
    EXPECT_EQ(*sample, expected);
}

TEST(StylusReport, RejectsShortBuffers) {
    auto payload = report(0x09);
    for (size_t length = 0; length < payload.size(); length++) {
        EXPECT_FALSE(decode_stylus_report(payload.data(), length).has_value()) << "length " << length;
    }
    EXPECT_FALSE(decode_stylus_report(nullptr, 10).has_value());
}

TEST(StylusReport, RejectsOtherReportIds) {
    auto payload = report(0x09);
    for (int id : {0x00, 0x02, 0x06, 0x08, 0xff}) {
        payload[0] = static_cast<uint8_t>(id);
        EXPECT_FALSE(decode_stylus_report(payload.data(), payload.size()).has_value()) << "id " << id;
    }
}

TEST(StylusReport, DecodesLittleEndianFields) {
    auto payload = report(0x00);
    auto sample = decode_stylus_report(payload.data(), payload.size());
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->x, 0x1234);
    EXPECT_EQ(sample->y, 0x5678);
    EXPECT_EQ(sample->pressure, 0x3fff);
}

TEST(StylusReport, TiltIsTwosComplement) {
    const std::pair<uint8_t, int> cases[] = {{0x00, 0}, {0xff, -1}, {0x7f, 127}, {0x80, -128}, {0xc0, -64}};
    for (const auto& [byte, expected] : cases) {
        auto payload = report(0x00, byte, byte);
        auto sample = decode_stylus_report(payload.data(), payload.size());
        ASSERT_TRUE(sample.has_value());
        EXPECT_EQ(sample->tilt_x, expected) << "byte " << static_cast<int>(byte);
        EXPECT_EQ(sample->tilt_y, expected) << "byte " << static_cast<int>(byte);
    }
}

TEST(StylusReport, StatusBitsAreIndependent) {
    auto payload = report(STATUS_BARREL | STATUS_ERASER | STATUS_INVERT);
    auto sample = decode_stylus_report(payload.data(), payload.size());
    ASSERT_TRUE(sample.has_value());
    EXPECT_FALSE(sample->tip);
    EXPECT_TRUE(sample->barrel);
    EXPECT_TRUE(sample->eraser);
    EXPECT_FALSE(sample->in_range);
    EXPECT_TRUE(sample->invert);
}

TEST(StylusReport, UnassignedStatusBitsAreIgnored) {
    auto plain = report(STATUS_TIP);
    auto noisy = report(STATUS_TIP | 0x10 | 0x40 | 0x80);
    auto a = decode_stylus_report(plain.data(), plain.size());
    auto b = decode_stylus_report(noisy.data(), noisy.size());
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, *b);
}

TEST(StylusReport, CoordinatesAreNotClamped) {
    std::vector<uint8_t> payload = {0x07, 0x08, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x00, 0x00};
    auto sample = decode_stylus_report(payload.data(), payload.size());
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->x, 0xffff);
    EXPECT_EQ(sample->y, 0xffff);
    EXPECT_EQ(sample->pressure, 0xffff);
}

TEST(StylusReport, JsonLineUsesFieldNames) {
    StylusSample sample;
    sample.tip = true;
    sample.in_range = true;
    sample.y = 100;
    sample.pressure = 8192;
    sample.tilt_x = -3;
    EXPECT_EQ(sample_to_json(sample),
              "{\"tip\": true, \"barrel\": false, \"eraser\": false, \"in_range\": true, "
              "\"invert\": false, \"x\": 0, \"y\": 100, \"pressure\": 8192, \"tilt_x\": -3, \"tilt_y\": 0}");
}

TEST(StylusReport, HexdumpSeparatesBytes) {
    const uint8_t bytes[] = {0x07, 0x09, 0xab};
    EXPECT_EQ(hexdump(bytes, sizeof(bytes)), "07 09 ab");
    EXPECT_EQ(hexdump(bytes, 0), "");
}

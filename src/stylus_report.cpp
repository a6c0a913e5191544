#include "stylus_report.hpp"
#include "tablet_constants.hpp"

#include <cstdio>
#include <sstream>

namespace {

uint16_t read_le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

int8_t read_signed(uint8_t byte) {
    return static_cast<int8_t>(byte & 0x80 ? static_cast<int>(byte) - 0x100 : byte);
}

const char* json_bool(bool value) {
    return value ? "true" : "false";
}

} // namespace

std::optional<StylusSample> decode_stylus_report(const uint8_t* data, size_t length) {
    if (!data || length < STYLUS_REPORT_MIN_LENGTH || data[0] != STYLUS_REPORT_ID) {
        return std::nullopt;
    }

    const uint8_t status = data[1];

    StylusSample sample;
    sample.tip = status & STATUS_TIP;
    sample.barrel = status & STATUS_BARREL;
    sample.eraser = status & STATUS_ERASER;
    sample.in_range = status & STATUS_IN_RANGE;
    sample.invert = status & STATUS_INVERT;
    sample.x = read_le16(data + 2);
    sample.y = read_le16(data + 4);
    sample.pressure = read_le16(data + 6);
    sample.tilt_x = read_signed(data[8]);
    sample.tilt_y = read_signed(data[9]);
    return sample;
}

std::string hexdump(const uint8_t* data, size_t length) {
    std::string result;
    result.reserve(length * 3);

    char byte_text[4];
    for (size_t i = 0; i < length; i++) {
        snprintf(byte_text, sizeof(byte_text), "%02x", data[i]);
        if (i > 0) result += ' ';
        result += byte_text;
    }
    return result;
}

std::string sample_to_json(const StylusSample& sample) {
    std::ostringstream out;
    out << "{\"tip\": " << json_bool(sample.tip)
        << ", \"barrel\": " << json_bool(sample.barrel)
        << ", \"eraser\": " << json_bool(sample.eraser)
        << ", \"in_range\": " << json_bool(sample.in_range)
        << ", \"invert\": " << json_bool(sample.invert)
        << ", \"x\": " << sample.x
        << ", \"y\": " << sample.y
        << ", \"pressure\": " << sample.pressure
        << ", \"tilt_x\": " << static_cast<int>(sample.tilt_x)
        << ", \"tilt_y\": " << static_cast<int>(sample.tilt_y)
        << "}";
    return out.str();
}

#ifndef STYLUS_REPORT_HPP
#define STYLUS_REPORT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

struct StylusSample {
    bool tip = false;
    bool barrel = false;
    bool eraser = false;
    bool in_range = false;
    bool invert = false;
    uint16_t x = 0;
    uint16_t y = 0;
    uint16_t pressure = 0;
    int8_t tilt_x = 0;
    int8_t tilt_y = 0;

    bool operator==(const StylusSample& other) const {
        return tip == other.tip && barrel == other.barrel && eraser == other.eraser &&
               in_range == other.in_range && invert == other.invert &&
               x == other.x && y == other.y && pressure == other.pressure &&
               tilt_x == other.tilt_x && tilt_y == other.tilt_y;
    }
    bool operator!=(const StylusSample& other) const { return !(*this == other); }
};

// Status byte layout of the pen report
constexpr uint8_t STATUS_TIP = 0x01;
constexpr uint8_t STATUS_BARREL = 0x02;
constexpr uint8_t STATUS_ERASER = 0x04;
constexpr uint8_t STATUS_IN_RANGE = 0x08;
constexpr uint8_t STATUS_INVERT = 0x20;

// Returns nullopt for short buffers and reports with another id. Any other
// bit pattern decodes to a sample; coordinates are not range checked.
std::optional<StylusSample> decode_stylus_report(const uint8_t* data, size_t length);

std::string hexdump(const uint8_t* data, size_t length);

// Single-line JSON object, field names as in StylusSample.
std::string sample_to_json(const StylusSample& sample);

#endif // STYLUS_REPORT_HPP

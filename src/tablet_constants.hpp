#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

// XP-Pen Deco Mini7 V2
constexpr uint16_t TABLET_VENDOR_ID = 0x28bd;
constexpr uint16_t TABLET_PRODUCT_ID = 0x0928;

constexpr int STYLUS_INTERFACE = 2;
constexpr unsigned char STYLUS_ENDPOINT = 0x83;
constexpr int STYLUS_READ_SIZE = 64;

constexpr uint8_t STYLUS_REPORT_ID = 0x07;
constexpr size_t STYLUS_REPORT_MIN_LENGTH = 10;

// Interfaces that must see SET_IDLE + GET_REPORT_DESCRIPTOR before the
// firmware starts streaming pen reports, with their descriptor lengths.
constexpr std::pair<int, uint16_t> UNLOCK_REPORT_LENGTHS[] = {
    {0, 0x0096},
    {1, 0x0064},
    {2, 0x0018},
};

constexpr unsigned int CONTROL_TIMEOUT_MS = 1000;

constexpr const char* DEFAULT_UINPUT_NAME = "XP-Pen Deco Mini7 V2 (uinput)";
constexpr const char* DEFAULT_UINPUT_PATH = "/dev/uinput";
constexpr const char* INPUT_DEVICE_DIR = "/dev/input";
constexpr const char* DEFAULT_EVENT_GROUP = "input";
constexpr unsigned int DEFAULT_EVENT_MODE = 0660;

// Keeps the interval in milliseconds well inside an int
constexpr double MAX_SCAN_INTERVAL_SECONDS = 86400.0;

constexpr const char* USBCONFIG_COMMAND = "usbconfig";

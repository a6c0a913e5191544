#pragma once

#include "tablet_constants.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Version marker for the config format
constexpr int CONFIG_VERSION = 1;

struct Config {
    int version = CONFIG_VERSION;

    // Tablet selection
    std::string device;  // "ugenB.A", empty to scan
    bool scan = false;
    double scan_interval = 5.0;
    int restart_delay_ms = 1000;
    int timeout_ms = 100;
    uint16_t vendor_id = TABLET_VENDOR_ID;
    uint16_t product_id = TABLET_PRODUCT_ID;

    // USB recovery
    bool force_detach = false;
    bool skip_set_alt = false;

    // Outputs
    bool uinput = true;
    std::string uinput_path = DEFAULT_UINPUT_PATH;
    std::string uinput_name = DEFAULT_UINPUT_NAME;
    std::string socket_path;
    unsigned int event_mode = DEFAULT_EVENT_MODE;
    std::string event_group = DEFAULT_EVENT_GROUP;

    // Process
    bool daemonize = false;
    bool verbose = false;

    bool has_sinks() const { return uinput || !socket_path.empty(); }
};

class ConfigManager {
public:
    static std::string get_config_path();
    // nullopt when the file cannot be read; bad values are reported and skipped.
    static std::optional<Config> load(const std::string& config_path);
    static Config parse(const std::string& json);
    static std::string serialize(const Config& config);
    static bool save(const std::string& config_path, const Config& config);

    // Empty string when usable, otherwise what is wrong.
    static std::string validate(const Config& config);

    static std::optional<unsigned int> parse_octal_mode(const std::string& text);
    static std::optional<uint16_t> parse_hex_id(const std::string& text);
    static std::string format_octal_mode(unsigned int mode);
    static std::string format_hex_id(uint16_t id);

    static std::string escape_json_string(const std::string& str);
    static std::string unescape_json_string(const std::string& str);
    static std::optional<std::string> get_json_value(const std::string& json, std::string_view key);
};

// config.cpp - penbridge settings file
#include "config.hpp"
#include "usb_device.hpp"
#include "log.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace {

void read_string(const std::string& json, std::string_view key, std::string& out) {
    auto value = ConfigManager::get_json_value(json, key);
    if (value) {
        out = ConfigManager::unescape_json_string(*value);
    }
}

void read_bool(const std::string& json, std::string_view key, bool& out) {
    auto value = ConfigManager::get_json_value(json, key);
    if (!value) return;
    if (*value == "true") {
        out = true;
    } else if (*value == "false") {
        out = false;
    } else {
        log_warning() << "Config: " << key << " must be true or false, got " << *value;
    }
}

void read_int(const std::string& json, std::string_view key, int& out) {
    auto value = ConfigManager::get_json_value(json, key);
    if (!value) return;
    try {
        size_t used = 0;
        int parsed = std::stoi(*value, &used);
        if (used != value->size()) throw std::invalid_argument("trailing characters");
        out = parsed;
    } catch (const std::exception&) {
        log_warning() << "Config: " << key << " is not an integer: " << *value;
    }
}

void read_double(const std::string& json, std::string_view key, double& out) {
    auto value = ConfigManager::get_json_value(json, key);
    if (!value) return;
    try {
        size_t used = 0;
        double parsed = std::stod(*value, &used);
        if (used != value->size()) throw std::invalid_argument("trailing characters");
        out = parsed;
    } catch (const std::exception&) {
        log_warning() << "Config: " << key << " is not a number: " << *value;
    }
}

} // namespace

// Get config path from environment or use default
std::string ConfigManager::get_config_path() {
    const char* env_path = getenv("PENBRIDGE_CONFIG");
    if (env_path) {
        return std::string(env_path);
    }

    const char* home = getenv("HOME");
    if (!home) {
        return "/usr/local/etc/penbridge/config.json";
    }

    return std::string(home) + "/.config/penbridge/config.json";
}

std::optional<Config> ConfigManager::load(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream contents;
    contents << file.rdbuf();
    return parse(contents.str());
}

Config ConfigManager::parse(const std::string& json) {
    Config config;

    auto version_opt = get_json_value(json, "version");
    if (version_opt) {
        int version = std::atoi(version_opt->c_str());
        if (version != CONFIG_VERSION) {
            log_warning() << "Config: unknown version " << *version_opt << ", reading anyway";
        }
    }

    auto settings_opt = get_json_value(json, "settings");
    if (!settings_opt) {
        return config;
    }
    const std::string& settings = *settings_opt;

    read_string(settings, "device", config.device);
    read_bool(settings, "scan", config.scan);
    read_double(settings, "scan_interval", config.scan_interval);
    read_int(settings, "restart_delay_ms", config.restart_delay_ms);
    read_int(settings, "timeout_ms", config.timeout_ms);
    read_bool(settings, "force_detach", config.force_detach);
    read_bool(settings, "skip_set_alt", config.skip_set_alt);
    read_bool(settings, "uinput", config.uinput);
    read_string(settings, "uinput_path", config.uinput_path);
    read_string(settings, "uinput_name", config.uinput_name);
    read_string(settings, "socket_path", config.socket_path);
    read_string(settings, "event_group", config.event_group);
    read_bool(settings, "daemonize", config.daemonize);
    read_bool(settings, "verbose", config.verbose);

    std::string text;
    if (auto mode = get_json_value(settings, "event_mode")) {
        text = unescape_json_string(*mode);
        if (auto parsed = parse_octal_mode(text)) {
            config.event_mode = *parsed;
        } else {
            log_warning() << "Config: event_mode is not an octal mode: " << text;
        }
    }
    if (auto vendor = get_json_value(settings, "vendor_id")) {
        text = unescape_json_string(*vendor);
        if (auto parsed = parse_hex_id(text)) {
            config.vendor_id = *parsed;
        } else {
            log_warning() << "Config: vendor_id is not a 16-bit hex id: " << text;
        }
    }
    if (auto product = get_json_value(settings, "product_id")) {
        text = unescape_json_string(*product);
        if (auto parsed = parse_hex_id(text)) {
            config.product_id = *parsed;
        } else {
            log_warning() << "Config: product_id is not a 16-bit hex id: " << text;
        }
    }

    return config;
}

std::string ConfigManager::serialize(const Config& config) {
    std::ostringstream out;
    out << "{\n";
    out << "  \"version\": " << config.version << ",\n";
    out << "  \"settings\": {\n";
    out << "    \"device\": \"" << escape_json_string(config.device) << "\",\n";
    out << "    \"scan\": " << (config.scan ? "true" : "false") << ",\n";
    out << "    \"scan_interval\": " << config.scan_interval << ",\n";
    out << "    \"restart_delay_ms\": " << config.restart_delay_ms << ",\n";
    out << "    \"timeout_ms\": " << config.timeout_ms << ",\n";
    out << "    \"vendor_id\": \"" << format_hex_id(config.vendor_id) << "\",\n";
    out << "    \"product_id\": \"" << format_hex_id(config.product_id) << "\",\n";
    out << "    \"force_detach\": " << (config.force_detach ? "true" : "false") << ",\n";
    out << "    \"skip_set_alt\": " << (config.skip_set_alt ? "true" : "false") << ",\n";
    out << "    \"uinput\": " << (config.uinput ? "true" : "false") << ",\n";
    out << "    \"uinput_path\": \"" << escape_json_string(config.uinput_path) << "\",\n";
    out << "    \"uinput_name\": \"" << escape_json_string(config.uinput_name) << "\",\n";
    out << "    \"socket_path\": \"" << escape_json_string(config.socket_path) << "\",\n";
    out << "    \"event_mode\": \"" << format_octal_mode(config.event_mode) << "\",\n";
    out << "    \"event_group\": \"" << escape_json_string(config.event_group) << "\",\n";
    out << "    \"daemonize\": " << (config.daemonize ? "true" : "false") << ",\n";
    out << "    \"verbose\": " << (config.verbose ? "true" : "false") << "\n";
    out << "  }\n";
    out << "}\n";
    return out.str();
}

bool ConfigManager::save(const std::string& config_path, const Config& config) {
    std::filesystem::path dir = std::filesystem::path(config_path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            log_error() << "Cannot create " << dir.string() << ": " << ec.message();
            return false;
        }
    }

    std::ofstream file(config_path);
    if (!file.is_open()) {
        return false;
    }
    file << serialize(config);
    return file.good();
}

std::string ConfigManager::validate(const Config& config) {
    if (!config.device.empty() && !parse_ugen(config.device)) {
        return "invalid device selector '" + config.device + "' (expected ugenB.A)";
    }
    if (!(config.scan_interval > 0.0)) {
        return "scan interval must be positive";
    }
    if (config.scan_interval > MAX_SCAN_INTERVAL_SECONDS) {
        return "scan interval cannot exceed one day";
    }
    if (config.timeout_ms <= 0) {
        return "timeout must be a positive number of milliseconds";
    }
    if (config.restart_delay_ms < 0) {
        return "restart delay cannot be negative";
    }
    if (config.event_mode > 07777) {
        return "event mode out of range";
    }
    if (!config.has_sinks()) {
        return "no output targets requested (uinput disabled and no socket path)";
    }
    return "";
}

std::optional<unsigned int> ConfigManager::parse_octal_mode(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    unsigned int mode = 0;
    for (char c : text) {
        if (c < '0' || c > '7') {
            return std::nullopt;
        }
        mode = mode * 8 + static_cast<unsigned int>(c - '0');
    }
    if (mode > 07777) {
        return std::nullopt;
    }
    return mode;
}

std::optional<uint16_t> ConfigManager::parse_hex_id(const std::string& text) {
    std::string digits = text;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > 4) {
        return std::nullopt;
    }
    unsigned int value = 0;
    for (char c : digits) {
        int nibble;
        if (c >= '0' && c <= '9') nibble = c - '0';
        else if (c >= 'a' && c <= 'f') nibble = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') nibble = c - 'A' + 10;
        else return std::nullopt;
        value = value * 16 + static_cast<unsigned int>(nibble);
    }
    return static_cast<uint16_t>(value);
}

std::string ConfigManager::format_octal_mode(unsigned int mode) {
    char buffer[8];
    snprintf(buffer, sizeof(buffer), "%o", mode);
    return buffer;
}

std::string ConfigManager::format_hex_id(uint16_t id) {
    char buffer[8];
    snprintf(buffer, sizeof(buffer), "0x%04x", id);
    return buffer;
}

std::string ConfigManager::escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 10);

    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: result += c; break;
        }
    }

    return result;
}

std::string ConfigManager::unescape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '\\' && i + 1 < str.size()) {
            switch (str[i + 1]) {
                case '"': result += '"'; ++i; break;
                case '\\': result += '\\'; ++i; break;
                case '/': result += '/'; ++i; break;
                case 'n': result += '\n'; ++i; break;
                case 'r': result += '\r'; ++i; break;
                case 't': result += '\t'; ++i; break;
                default: result += str[i]; break;
            }
        } else {
            result += str[i];
        }
    }

    return result;
}

// Returns the raw text of the first value stored under key: object and
// array values with their brackets, strings without quotes and still escaped.
std::optional<std::string> ConfigManager::get_json_value(const std::string& json, std::string_view key) {
    std::string search_key = "\"";
    search_key += key;
    search_key += "\"";

    size_t key_pos = json.find(search_key);
    if (key_pos == std::string::npos) {
        return std::nullopt;
    }

    size_t colon_pos = json.find_first_not_of(" \t\r\n", key_pos + search_key.size());
    if (colon_pos == std::string::npos || json[colon_pos] != ':') {
        return std::nullopt;
    }

    size_t value_start = json.find_first_not_of(" \t\r\n", colon_pos + 1);
    if (value_start == std::string::npos) {
        return std::nullopt;
    }

    const char first = json[value_start];
    if (first == '[' || first == '{') {
        const char open = first;
        const char close = (open == '[') ? ']' : '}';
        int depth = 0;
        bool in_string = false;
        bool escape = false;

        for (size_t i = value_start; i < json.size(); ++i) {
            const char c = json[i];

            if (in_string) {
                if (escape) { escape = false; continue; }
                if (c == '\\') { escape = true; continue; }
                if (c == '"') in_string = false;
                continue;
            }

            if (c == '"') { in_string = true; continue; }
            if (c == open) { depth++; continue; }
            if (c == close && --depth == 0) {
                return json.substr(value_start, (i - value_start) + 1);
            }
        }
        return std::nullopt;
    }

    if (first == '"') {
        bool escape = false;
        for (size_t i = value_start + 1; i < json.size(); ++i) {
            if (escape) { escape = false; continue; }
            if (json[i] == '\\') { escape = true; continue; }
            if (json[i] == '"') {
                return json.substr(value_start + 1, i - (value_start + 1));
            }
        }
        return std::nullopt;
    }

    size_t value_end = json.find_first_of(",}]\n", value_start);
    if (value_end == std::string::npos) {
        value_end = json.size();
    }

    std::string value = json.substr(value_start, value_end - value_start);
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    return value;
}

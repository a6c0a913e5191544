#include "usb_device.hpp"

#include <cctype>

namespace {

std::optional<int> parse_decimal(const std::string& text) {
    if (text.empty() || text.size() > 6) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

std::optional<BusAddress> parse_ugen(const std::string& ugen) {
    const std::string prefix = "ugen";
    if (ugen.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string rest = ugen.substr(prefix.size());
    size_t dot = rest.find('.');
    if (dot == std::string::npos || rest.find('.', dot + 1) != std::string::npos) {
        return std::nullopt;
    }

    auto bus = parse_decimal(rest.substr(0, dot));
    auto address = parse_decimal(rest.substr(dot + 1));
    if (!bus || !address) {
        return std::nullopt;
    }
    return BusAddress{*bus, *address};
}

std::string format_ugen(const BusAddress& where) {
    return "ugen" + std::to_string(where.bus) + "." + std::to_string(where.address);
}

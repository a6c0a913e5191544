#ifndef DIAGNOSTICS_HPP
#define DIAGNOSTICS_HPP

#include "config.hpp"
#include "usb_device.hpp"

#include <optional>
#include <ostream>
#include <string>

// Full path of an executable found through PATH.
std::optional<std::string> find_in_path(const std::string& program);

// Prints the --check report. Returns 0 when every required check passed, 1 otherwise.
int run_diagnostics(const Config& config, UsbBus& bus, std::ostream& out);

#endif // DIAGNOSTICS_HPP

#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include "config.hpp"

#include <string>

struct CliOptions {
    Config config;
    std::string config_path;
    std::string write_config_path;
    bool check = false;
    bool show_help = false;
    bool show_version = false;
};

// Value of --config if present, otherwise the default config location.
std::string find_config_override(int argc, char* argv[]);

// Applies argv on top of options.config. False with error set on a bad flag or value.
bool parse_command_line(int argc, char* argv[], CliOptions& options, std::string& error);

void print_usage(const char* program_name);

#endif // CLI_OPTIONS_HPP

#include "cli_options.hpp"

#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

namespace {

// Owns argv storage for one parse.
class Args {
public:
    Args(const Args&) = delete;
    Args& operator=(const Args&) = delete;

    Args(std::initializer_list<const char*> list) : Args(std::vector<const char*>(list)) {}
    explicit Args(const std::vector<const char*>& list) {
        storage.emplace_back("penbridge");
        for (const char* arg : list) {
            storage.emplace_back(arg);
        }
        for (auto& s : storage) {
            pointers.push_back(&s[0]);
        }
        pointers.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return pointers.data(); }

private:
    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

bool parse(Args& args, CliOptions& options, std::string& error) {
    return parse_command_line(args.argc(), args.argv(), options, error);
}

} // namespace

TEST(CliOptions, NoArgumentsKeepsDefaults) {
    Args args({});
    CliOptions options;
    std::string error;
    ASSERT_TRUE(parse(args, options, error));
    EXPECT_TRUE(options.config.device.empty());
    EXPECT_TRUE(options.config.uinput);
    EXPECT_FALSE(options.check);
}

TEST(CliOptions, ParsesEveryFlag) {
    Args args({"--device", "ugen0.3", "--scan-interval", "2.5", "--timeout", "50", "--no-uinput",
               "--socket-path", "/run/pen.sock", "--event-mode", "640", "--event-group", "wheel",
               "--force-detach", "--skip-set-alt", "--daemonize", "--verbose", "--check"});
    CliOptions options;
    std::string error;
    ASSERT_TRUE(parse(args, options, error)) << error;

    const Config& config = options.config;
    EXPECT_EQ(config.device, "ugen0.3");
    EXPECT_DOUBLE_EQ(config.scan_interval, 2.5);
    EXPECT_EQ(config.timeout_ms, 50);
    EXPECT_FALSE(config.uinput);
    EXPECT_EQ(config.socket_path, "/run/pen.sock");
    EXPECT_EQ(config.event_mode, 0640u);
    EXPECT_EQ(config.event_group, "wheel");
    EXPECT_TRUE(config.force_detach);
    EXPECT_TRUE(config.skip_set_alt);
    EXPECT_TRUE(config.daemonize);
    EXPECT_TRUE(config.verbose);
    EXPECT_TRUE(options.check);
}

TEST(CliOptions, FlagsOverrideLoadedConfig) {
    Args args({"--timeout", "30"});
    CliOptions options;
    options.config.timeout_ms = 500;
    options.config.socket_path = "/from/file.sock";
    std::string error;
    ASSERT_TRUE(parse(args, options, error));
    EXPECT_EQ(options.config.timeout_ms, 30);
    EXPECT_EQ(options.config.socket_path, "/from/file.sock");
}

TEST(CliOptions, ScanClearsConfiguredDevice) {
    Args args({"--scan"});
    CliOptions options;
    options.config.device = "ugen1.1";
    std::string error;
    ASSERT_TRUE(parse(args, options, error));
    EXPECT_TRUE(options.config.device.empty());
    EXPECT_TRUE(options.config.scan);
}

TEST(CliOptions, RejectsBadValues) {
    const std::vector<std::vector<const char*>> cases = {
        {"--device", "da0"},
        {"--device", "ugen1.x"},
        {"--event-mode", "rw-rw----"},
        {"--event-mode", "8"},
        {"--scan-interval", "soon"},
        {"--scan-interval", "0"},
        {"--scan-interval", "3000000"},
        {"--timeout", "10ms"},
        {"--timeout", "-1"},
        {"--bogus"},
    };
    for (const auto& c : cases) {
        Args args(c);
        CliOptions options;
        std::string error;
        EXPECT_FALSE(parse(args, options, error)) << c[0];
        EXPECT_FALSE(error.empty()) << c[0];
    }
}

TEST(CliOptions, MissingValueIsAnError) {
    Args args({"--socket-path"});
    CliOptions options;
    std::string error;
    EXPECT_FALSE(parse(args, options, error));
    EXPECT_EQ(error, "--socket-path requires a value");
}

TEST(CliOptions, ConfigOverrideIsFoundFirst) {
    Args args({"--verbose", "--config", "/tmp/pen.json"});
    EXPECT_EQ(find_config_override(args.argc(), args.argv()), "/tmp/pen.json");

    CliOptions options;
    std::string error;
    ASSERT_TRUE(parse(args, options, error));
    EXPECT_EQ(options.config_path, "/tmp/pen.json");
}

TEST(CliOptions, InformationalFlags) {
    Args args({"--version", "-h", "--write-config", "/tmp/out.json"});
    CliOptions options;
    std::string error;
    ASSERT_TRUE(parse(args, options, error));
    EXPECT_TRUE(options.show_version);
    EXPECT_TRUE(options.show_help);
    EXPECT_EQ(options.write_config_path, "/tmp/out.json");
}

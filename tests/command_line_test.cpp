#include "command_line.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

namespace emu {
namespace {

TEST(CommandLineTest, NoArgumentsStartsInteractive) {
    const CommandLine cli = parse_command_line({});
    EXPECT_EQ(cli.command, Command::Interactive);
    EXPECT_FALSE(cli.demo);
    EXPECT_TRUE(cli.config_path.empty());
}

TEST(CommandLineTest, GlobalOptions) {
    const CommandLine cli = parse_command_line({"--config", "/tmp/emu.json", "--demo", "-v"});
    EXPECT_EQ(cli.config_path, "/tmp/emu.json");
    EXPECT_TRUE(cli.demo);
    EXPECT_TRUE(cli.verbose);
}

TEST(CommandLineTest, ListWithOptions) {
    const CommandLine cli = parse_command_line({"list", "--platform", "ios", "--json"});
    EXPECT_EQ(cli.command, Command::List);
    EXPECT_EQ(cli.platform, "ios");
    EXPECT_TRUE(cli.json);
}

TEST(CommandLineTest, DeviceCommandsTakeOnePositional) {
    const CommandLine cli = parse_command_line({"delete", "Pixel_7", "-y"});
    EXPECT_EQ(cli.command, Command::Delete);
    EXPECT_EQ(cli.device, "Pixel_7");
    EXPECT_TRUE(cli.assume_yes);

    EXPECT_THROW((void)parse_command_line({"start"}), std::invalid_argument);
    EXPECT_THROW((void)parse_command_line({"start", "a", "b"}), std::invalid_argument);
}

TEST(CommandLineTest, OptionsAreScopedToTheirCommand) {
    EXPECT_THROW((void)parse_command_line({"start", "a", "--yes"}), std::invalid_argument);
    EXPECT_THROW((void)parse_command_line({"stop", "a", "--json"}), std::invalid_argument);
    EXPECT_THROW((void)parse_command_line({"--platform", "ios"}), std::invalid_argument);
}

TEST(CommandLineTest, Create) {
    const CommandLine cli = parse_command_line({"create", "--platform", "android", "--name", "Fresh",
                                                "--device-type", "pixel_7", "--version",
                                                "system-images;android-34;google_apis;x86_64", "--ram", "4096"});
    EXPECT_EQ(cli.command, Command::Create);
    EXPECT_EQ(cli.name, "Fresh");
    EXPECT_EQ(cli.device_type, "pixel_7");
    EXPECT_EQ(cli.ram_mb, 4096);
    EXPECT_EQ(cli.storage_mb, 0);
}

TEST(CommandLineTest, CreateRequiresItsOptions) {
    EXPECT_THROW((void)parse_command_line({"create", "--platform", "ios", "--name", "X", "--version", "r"}),
                 std::invalid_argument);
    EXPECT_THROW((void)parse_command_line({"create", "--platform", "all", "--name", "X", "--device-type", "t",
                                           "--version", "r"}),
                 std::invalid_argument);
    EXPECT_THROW((void)parse_command_line({"create", "--platform", "android", "--name", "X", "--device-type", "t",
                                           "--version", "r", "--ram", "lots"}),
                 std::invalid_argument);
}

TEST(CommandLineTest, MissingValueAndUnknownWords) {
    try {
        (void)parse_command_line({"--config"});
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_EQ(std::string(e.what()), "--config requires an argument");
    }
    EXPECT_THROW((void)parse_command_line({"reboot"}), std::invalid_argument);
    EXPECT_THROW((void)parse_command_line({"--frobnicate"}), std::invalid_argument);
}

TEST(CommandLineTest, HelpSkipsValidation) {
    const CommandLine cli = parse_command_line({"create", "--help"});
    EXPECT_TRUE(cli.show_help);

    std::ostringstream out;
    print_usage(out, "emu");
    EXPECT_EQ(out.str().rfind("Usage: emu", 0), 0u);
    EXPECT_NE(out.str().find("create --platform"), std::string::npos);
}

} // namespace
} // namespace emu

#include "errors.hpp"
#include "fakes/scripted_command_executor.hpp"
#include "ios/ios_device_manager.hpp"
#include "ios/simctl_parser.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace emu {
namespace {

using testing::ScriptedCommandExecutor;
using namespace std::chrono_literals;

constexpr const char* kDeviceList = R"json({
  "devices": {
    "com.apple.CoreSimulator.SimRuntime.iOS-17-2": [
      {
        "udid": "AAAA-1111",
        "name": "iPhone 15",
        "state": "Booted",
        "isAvailable": true,
        "deviceTypeIdentifier": "com.apple.CoreSimulator.SimDeviceType.iPhone-15",
        "dataPath": "/Users/dev/Library/Developer/CoreSimulator/Devices/AAAA-1111/data",
        "logPath": "/Users/dev/Library/Logs/CoreSimulator/AAAA-1111"
      },
      {
        "udid": "BBBB-2222",
        "name": "iPad Air",
        "state": "Shutdown",
        "deviceTypeIdentifier": "com.apple.CoreSimulator.SimDeviceType.iPad-Air-5th-generation"
      },
      { "name": "no udid" }
    ],
    "com.apple.CoreSimulator.SimRuntime.iOS-16-4": [
      {
        "udid": "CCCC-3333",
        "name": "iPhone 14",
        "state": "Shutdown",
        "isAvailable": false
      }
    ]
  }
})json";

constexpr const char* kDeviceTypes = R"json({
  "devicetypes": [
    { "identifier": "com.apple.CoreSimulator.SimDeviceType.iPhone-15", "name": "iPhone 15", "productFamily": "iPhone" },
    { "identifier": "com.apple.CoreSimulator.SimDeviceType.iPad-Pro-11", "name": "iPad Pro (11-inch)", "productFamily": "iPad" },
    { "identifier": "com.apple.CoreSimulator.SimDeviceType.Apple-Watch-Series-9-45mm", "name": "Apple Watch Series 9 (45mm)", "productFamily": "Apple Watch" },
    { "name": "missing identifier" }
  ]
})json";

constexpr const char* kRuntimes = R"json({
  "runtimes": [
    { "identifier": "com.apple.CoreSimulator.SimRuntime.iOS-16-4", "name": "iOS 16.4", "version": "16.4", "isAvailable": true },
    { "identifier": "com.apple.CoreSimulator.SimRuntime.iOS-17-2", "name": "iOS 17.2", "version": "17.2", "isAvailable": true },
    { "identifier": "com.apple.CoreSimulator.SimRuntime.iOS-15-0", "name": "iOS 15.0", "isAvailable": false },
    { "identifier": "com.apple.CoreSimulator.SimRuntime.iOS-17-10", "version": "17.10", "isAvailable": true }
  ]
})json";

TEST(SimctlParserTest, ParsesDeviceList) {
    const auto sims = ios::parse_device_list(kDeviceList);
    ASSERT_EQ(sims.size(), 3u);

    const auto it = std::ranges::find(sims, std::string("AAAA-1111"), &ios::SimDevice::udid);
    ASSERT_NE(it, sims.end());
    EXPECT_EQ(it->name, "iPhone 15");
    EXPECT_EQ(it->state, "Booted");
    EXPECT_EQ(it->runtime_id, "com.apple.CoreSimulator.SimRuntime.iOS-17-2");
    EXPECT_TRUE(it->is_available);
    EXPECT_EQ(it->log_path, "/Users/dev/Library/Logs/CoreSimulator/AAAA-1111");

    const auto ipad = std::ranges::find(sims, std::string("BBBB-2222"), &ios::SimDevice::udid);
    ASSERT_NE(ipad, sims.end());
    EXPECT_TRUE(ipad->is_available);

    const auto old = std::ranges::find(sims, std::string("CCCC-3333"), &ios::SimDevice::udid);
    ASSERT_NE(old, sims.end());
    EXPECT_FALSE(old->is_available);
}

TEST(SimctlParserTest, MalformedListIsParseFailure) {
    try {
        (void)ios::parse_device_list("{ not json");
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ParseFailure);
    }
    EXPECT_THROW((void)ios::parse_device_list(R"({"runtimes": []})"), DeviceError);
}

TEST(SimctlParserTest, DeviceTypesMapProductFamily) {
    const auto types = ios::parse_device_types(kDeviceTypes);
    ASSERT_EQ(types.size(), 3u);
    EXPECT_EQ(types[0].category, "phone");
    EXPECT_EQ(types[1].category, "tablet");
    EXPECT_EQ(types[1].display_name, "iPad Pro (11-inch)");
    EXPECT_EQ(types[2].category, "wear");
}

TEST(SimctlParserTest, RuntimesAreAvailableAndNewestFirst) {
    const auto runtimes = ios::parse_runtimes(kRuntimes);
    ASSERT_EQ(runtimes.size(), 3u);
    EXPECT_EQ(runtimes[0].display_name, "iOS 17.10");
    EXPECT_EQ(runtimes[1].display_name, "iOS 17.2");
    EXPECT_EQ(runtimes[2].display_name, "iOS 16.4");
}

TEST(SimctlParserTest, StatesAndNames) {
    EXPECT_EQ(ios::parse_state("Booted"), DeviceStatus::Running);
    EXPECT_EQ(ios::parse_state("Shutdown"), DeviceStatus::Stopped);
    EXPECT_EQ(ios::parse_state("Shutting Down"), DeviceStatus::Stopping);
    EXPECT_EQ(ios::parse_state("Creating"), DeviceStatus::Unknown);

    EXPECT_EQ(ios::runtime_display_name("com.apple.CoreSimulator.SimRuntime.iOS-17-2"), "iOS 17.2");
    EXPECT_EQ(ios::runtime_display_name("com.apple.CoreSimulator.SimRuntime.watchOS-10-0"), "watchOS 10.0");
    EXPECT_EQ(ios::device_type_display_name("com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro"), "iPhone 15 Pro");
}

TEST(SimctlParserTest, CompactLogLines) {
    const auto error = ios::parse_compact_log_line(
        "2024-01-15 10:30:00.123 E  SpringBoard[52:1a3] [com.apple.SpringBoard] failed");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->first, LogLevel::Error);
    EXPECT_EQ(error->second, "SpringBoard[52:1a3] [com.apple.SpringBoard] failed");

    EXPECT_EQ(ios::parse_compact_log_line("2024-01-15 10:30:00.123 Db backboardd[1:2] x")->first, LogLevel::Debug);
    EXPECT_EQ(ios::parse_compact_log_line("2024-01-15 10:30:00.123 Df backboardd[1:2] x")->first, LogLevel::Info);
    EXPECT_FALSE(ios::parse_compact_log_line("Timestamp               Ty Process[PID:TID]").has_value());
    EXPECT_FALSE(ios::parse_compact_log_line("").has_value());
}

class IosDeviceManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor.on_success("simctl help", "usage: simctl");
        executor.on_success("simctl list devices --json", kDeviceList);
        executor.on_success("simctl list devicetypes --json", kDeviceTypes);
        executor.on_success("simctl list runtimes --json", kRuntimes);
    }

    ScriptedCommandExecutor executor;
    IosDeviceManager manager{executor, 5000ms};
    CancellationToken token;
};

TEST_F(IosDeviceManagerTest, ListsAvailableSimulatorsNewestRuntimeFirst) {
    const auto devices = manager.list_devices(token);
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].name, "iPad Air");
    EXPECT_EQ(devices[1].name, "iPhone 15");
    EXPECT_EQ(devices[1].status, DeviceStatus::Running);
    EXPECT_EQ(std::get<IosAttributes>(devices[1].attributes).runtime, "iOS 17.2");

    const auto specs = executor.specs();
    ASSERT_FALSE(specs.empty());
    EXPECT_EQ(specs[0].program, "xcrun");
    EXPECT_EQ(specs[0].timeout, 5000ms);
}

TEST_F(IosDeviceManagerTest, AvailabilityFollowsSimctl) {
    EXPECT_TRUE(manager.is_available(token));

    ScriptedCommandExecutor missing_tools;
    missing_tools.missing("xcrun");
    IosDeviceManager unavailable(missing_tools, 5000ms);
    EXPECT_FALSE(unavailable.is_available(token));
}

TEST_F(IosDeviceManagerTest, BootOpensSimulatorApp) {
    executor.on_success("simctl boot BBBB-2222");
    manager.start_device("BBBB-2222", token);

    EXPECT_TRUE(executor.ran("simctl boot BBBB-2222"));
    ASSERT_EQ(executor.detached().size(), 1u);
    EXPECT_EQ(executor.detached()[0], "open -a Simulator");
}

TEST_F(IosDeviceManagerTest, BootingBootedDeviceIsNotAnError) {
    executor.on_failure("simctl boot AAAA-1111",
                        "Unable to boot device in current state: Booted", 149);
    EXPECT_NO_THROW(manager.start_device("AAAA-1111", token));
}

TEST_F(IosDeviceManagerTest, ShutdownFailureCarriesStderr) {
    executor.on_failure("simctl shutdown BBBB-2222", "CoreSimulator is unhappy\nmore detail");
    try {
        manager.stop_device("BBBB-2222", token);
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CommandFailed);
        EXPECT_EQ(std::string(e.what()), "CoreSimulator is unhappy");
    }
}

TEST_F(IosDeviceManagerTest, CreateRejectsDuplicateNameOnSameRuntime) {
    DeviceConfig config;
    config.platform = Platform::Ios;
    config.name = "iPhone 15";
    config.device_type = "com.apple.CoreSimulator.SimDeviceType.iPhone-15";
    config.version = "com.apple.CoreSimulator.SimRuntime.iOS-17-2";

    try {
        manager.create_device(config, token);
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NameCollision);
    }
    EXPECT_FALSE(executor.ran("simctl create"));
}

TEST_F(IosDeviceManagerTest, CreateRunsSimctlCreate) {
    executor.on_success("simctl create", "DDDD-4444\n");

    DeviceConfig config;
    config.platform = Platform::Ios;
    config.name = "Test_Phone";
    config.device_type = "com.apple.CoreSimulator.SimDeviceType.iPhone-15";
    config.version = "com.apple.CoreSimulator.SimRuntime.iOS-16-4";
    manager.create_device(config, token);

    EXPECT_TRUE(executor.ran("simctl create Test_Phone com.apple.CoreSimulator.SimDeviceType.iPhone-15 "
                             "com.apple.CoreSimulator.SimRuntime.iOS-16-4"));
}

TEST_F(IosDeviceManagerTest, DeleteShutsDownBootedDeviceFirst) {
    executor.on_success("simctl shutdown AAAA-1111");
    executor.on_success("simctl delete AAAA-1111");
    manager.delete_device("AAAA-1111", token);

    const auto commands = executor.commands();
    const auto shutdown = std::ranges::find(commands, std::string("xcrun simctl shutdown AAAA-1111"));
    const auto remove = std::ranges::find(commands, std::string("xcrun simctl delete AAAA-1111"));
    ASSERT_NE(shutdown, commands.end());
    ASSERT_NE(remove, commands.end());
    EXPECT_LT(shutdown, remove);
}

TEST_F(IosDeviceManagerTest, WipeUnknownDeviceIsNotFound) {
    try {
        manager.wipe_device("ZZZZ-0000", token);
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DeviceNotFound);
    }
}

TEST_F(IosDeviceManagerTest, DetailsIncludeIdentifiers) {
    const DeviceDetails details = manager.get_device_details("AAAA-1111", token);
    EXPECT_EQ(details.name, "iPhone 15");
    EXPECT_EQ(details.version, "iOS 17.2");
    EXPECT_EQ(details.device_type, "iPhone 15");
    ASSERT_FALSE(details.extra.empty());
    EXPECT_EQ(details.extra[0].first, "UDID");
    EXPECT_EQ(details.extra[0].second, "AAAA-1111");
}

TEST_F(IosDeviceManagerTest, LogStreamParsesCompactLines) {
    executor.on_stream("log stream", {
        "Filtering the log data using \"composedMessage CONTAINS\"",
        "Timestamp               Ty Process[PID:TID]",
        "2024-01-15 10:30:00.123 E  SpringBoard[52:1a3] boom",
        "2024-01-15 10:30:00.200 I  backboardd[60:1] fine",
    });

    std::vector<LogEntry> entries;
    manager.stream_logs("AAAA-1111", [&](LogEntry entry) { entries.push_back(std::move(entry)); }, token);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, LogLevel::Error);
    EXPECT_EQ(entries[0].source, (DeviceTag{Platform::Ios, "AAAA-1111"}));
    EXPECT_EQ(entries[1].message, "backboardd[60:1] fine");
}

TEST_F(IosDeviceManagerTest, StoppedDeviceHasNoLogStream) {
    std::vector<LogEntry> entries;
    manager.stream_logs("BBBB-2222", [&](LogEntry entry) { entries.push_back(std::move(entry)); }, token);

    EXPECT_TRUE(entries.empty());
    EXPECT_FALSE(executor.ran("log stream"));
}

TEST_F(IosDeviceManagerTest, FormOptions) {
    EXPECT_EQ(manager.list_device_types(token).size(), 3u);
    const auto versions = manager.list_versions(token);
    ASSERT_FALSE(versions.empty());
    EXPECT_EQ(versions[0].id, "com.apple.CoreSimulator.SimRuntime.iOS-17-10");
}

} // namespace
} // namespace emu

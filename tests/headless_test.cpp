#include "errors.hpp"
#include "fakes/fake_device_manager.hpp"
#include "fakes/test_helpers.hpp"
#include "headless.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>

namespace emu {
namespace {

using testing::FakeDeviceManager;
using testing::make_device;
using testing::make_devices;

class HeadlessTest : public ::testing::Test {
protected:
    void SetUp() override {
        android.set_devices({make_device(Platform::Android, "Pixel_7", DeviceStatus::Running),
                             make_device(Platform::Android, "Tablet")});

        Device phone = make_device(Platform::Ios, "AAAA-1111");
        phone.name = "iPhone 15";
        ios.set_devices({phone});
    }

    headless::Backends backends() { return {android, ios}; }

    FakeDeviceManager android{Platform::Android};
    FakeDeviceManager ios{Platform::Ios};
    std::ostringstream out;
};

TEST_F(HeadlessTest, ParsePlatform) {
    EXPECT_EQ(headless::parse_platform("android"), Platform::Android);
    EXPECT_EQ(headless::parse_platform("iOS"), Platform::Ios);
    EXPECT_FALSE(headless::parse_platform("all").has_value());
    EXPECT_THROW((void)headless::parse_platform("windows"), DeviceError);
}

TEST_F(HeadlessTest, ListPrintsBothFamilies) {
    EXPECT_EQ(headless::list_devices(backends(), std::nullopt, false, out), 0);

    const std::string text = out.str();
    EXPECT_NE(text.find("Android (2)"), std::string::npos);
    EXPECT_NE(text.find("iOS (1)"), std::string::npos);
    EXPECT_NE(text.find("Pixel_7"), std::string::npos);
    EXPECT_NE(text.find("API 34 (Android 14)"), std::string::npos);
    EXPECT_NE(text.find("[AAAA-1111]"), std::string::npos);
}

TEST_F(HeadlessTest, ListJson) {
    EXPECT_EQ(headless::list_devices(backends(), Platform::Ios, true, out), 0);

    const auto json = nlohmann::json::parse(out.str());
    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0]["platform"], "iOS");
    EXPECT_EQ(json[0]["identifier"], "AAAA-1111");
    EXPECT_EQ(json[0]["name"], "iPhone 15");
    EXPECT_EQ(json[0]["status"], "Stopped");
    EXPECT_EQ(json[0]["version"], "iOS 17.2");
}

TEST_F(HeadlessTest, ListSkipsUnavailableFamilyUnlessRequested) {
    ios.set_available(false);
    EXPECT_EQ(headless::list_devices(backends(), std::nullopt, false, out), 0);
    EXPECT_EQ(out.str().find("iOS ("), std::string::npos);

    EXPECT_THROW(headless::list_devices(backends(), Platform::Ios, false, out), DeviceError);
}

TEST_F(HeadlessTest, StartResolvesByDisplayName) {
    EXPECT_EQ(headless::start_device(backends(), "iPhone 15", std::nullopt, out), 0);
    EXPECT_EQ(ios.calls(), std::vector<std::string>{"start AAAA-1111"});
    EXPECT_EQ(out.str(), "Started iPhone 15\n");
}

TEST_F(HeadlessTest, StartRunningDeviceIsNoOp) {
    EXPECT_EQ(headless::start_device(backends(), "Pixel_7", std::nullopt, out), 0);
    EXPECT_TRUE(android.calls().empty());
    EXPECT_EQ(out.str(), "Pixel_7 is already running\n");
}

TEST_F(HeadlessTest, StopRunningDevice) {
    EXPECT_EQ(headless::stop_device(backends(), "Pixel_7", Platform::Android, out), 0);
    EXPECT_EQ(android.calls(), std::vector<std::string>{"stop Pixel_7"});
}

TEST_F(HeadlessTest, UnknownDeviceIsNotFound) {
    try {
        (void)headless::start_device(backends(), "Nexus", std::nullopt, out);
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DeviceNotFound);
        EXPECT_EQ(std::string(e.what()), "Device 'Nexus' not found");
    }
}

TEST_F(HeadlessTest, DeleteAsksForConfirmation) {
    std::istringstream no("n\n");
    EXPECT_EQ(headless::delete_device(backends(), "Tablet", std::nullopt, false, no, out), 1);
    EXPECT_TRUE(android.calls().empty());
    EXPECT_NE(out.str().find("Aborted"), std::string::npos);

    std::istringstream yes("yes\n");
    EXPECT_EQ(headless::delete_device(backends(), "Tablet", std::nullopt, false, yes, out), 0);
    EXPECT_EQ(android.calls(), std::vector<std::string>{"delete Tablet"});
}

TEST_F(HeadlessTest, WipeWithAssumeYesSkipsPrompt) {
    std::istringstream empty;
    EXPECT_EQ(headless::wipe_device(backends(), "Tablet", Platform::Android, true, empty, out), 0);
    EXPECT_EQ(android.calls(), std::vector<std::string>{"wipe Tablet"});
    EXPECT_EQ(out.str(), "Wiped Tablet\n");
}

TEST_F(HeadlessTest, BackendFailurePropagates) {
    android.fail_next("wipe", ErrorKind::CommandFailed, "emulator is still running");
    std::istringstream empty;
    EXPECT_THROW(headless::wipe_device(backends(), "Tablet", Platform::Android, true, empty, out), DeviceError);
}

TEST_F(HeadlessTest, CreateFillsAndroidDefaults) {
    DeviceConfig config;
    config.platform = Platform::Android;
    config.name = "New_Device";
    config.device_type = "pixel_7";
    config.version = "system-images;android-34;google_apis;x86_64";

    EXPECT_EQ(headless::create_device(backends(), config, out), 0);
    ASSERT_EQ(android.created().size(), 1u);
    EXPECT_EQ(android.created()[0].ram_mb, 2048);
    EXPECT_EQ(android.created()[0].storage_mb, 8192);
    EXPECT_EQ(out.str(), "Created New_Device\n");
}

TEST_F(HeadlessTest, CreateValidatesBeforeCallingBackend) {
    DeviceConfig config;
    config.platform = Platform::Android;
    config.name = "bad name";
    config.device_type = "pixel_7";
    config.version = "image";

    try {
        (void)headless::create_device(backends(), config, out);
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
        EXPECT_EQ(std::string(e.what()),
                  "Name: Device name can only contain letters, numbers, dots, dashes, and underscores");
    }

    config.name = "ok";
    config.ram_mb = 100;
    EXPECT_THROW((void)headless::create_device(backends(), config, out), DeviceError);
    EXPECT_TRUE(android.created().empty());
}

TEST_F(HeadlessTest, CreateIosNeedsRuntime) {
    DeviceConfig config;
    config.platform = Platform::Ios;
    config.name = "Phone";
    config.device_type = "com.apple.CoreSimulator.SimDeviceType.iPhone-15";

    EXPECT_THROW((void)headless::create_device(backends(), config, out), DeviceError);
    EXPECT_TRUE(ios.created().empty());
}

} // namespace
} // namespace emu

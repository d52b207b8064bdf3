#include "f8/info.hpp"
#include "fake_usb.hpp"
#include <gtest/gtest.h>

using namespace f8;
using namespace f8::test;

class Info : public ::testing::Test {
protected:
    std::shared_ptr<FakeDeviceState> state =
        std::make_shared<FakeDeviceState>();
    FakeUsbDevice device{state};
    FakeConnection connection{state};

    void SetUp() override {
        state->descriptor.vid = 0x1234;
        state->descriptor.pid = 0x5678;
        state->descriptor.manufacturer_index = 1;
        state->descriptor.product_index = 2;
        state->descriptor.serial_number_index = 3;
        state->active_configuration = 1;
    }
};

TEST_F(Info, ReadsStrings) {
    state->strings[1] = "Maker";
    state->strings[2] = "Keypad";
    state->strings[3] = "0001";

    DeviceInfo info = ReadDeviceInfo(device, connection);
    EXPECT_EQ(info.vid, 0x1234);
    EXPECT_EQ(info.pid, 0x5678);
    EXPECT_EQ(info.active_configuration, 1);
    EXPECT_TRUE(info.has_language);
    EXPECT_EQ(info.language, 0x0409);
    EXPECT_EQ(info.manufacturer, "Maker");
    EXPECT_EQ(info.product, "Keypad");
    EXPECT_EQ(info.serial_number, "0001");
}

TEST_F(Info, MissingStringsAreNotFound) {
    state->strings[2] = "Keypad";
    state->descriptor.serial_number_index = 0;

    DeviceInfo info = ReadDeviceInfo(device, connection);
    EXPECT_EQ(info.manufacturer, "Not Found");
    EXPECT_EQ(info.product, "Keypad");
    EXPECT_EQ(info.serial_number, "Not Found");
}

TEST_F(Info, DisconnectedDeviceFails) {
    state->disconnected = true;
    EXPECT_THROW(ReadDeviceInfo(device, connection),
                 error::DeviceUnavailableException);
}

TEST_F(Info, NoLanguageSkipsStrings) {
    state->strings[1] = "Maker";
    state->languages.clear();

    DeviceInfo info = ReadDeviceInfo(device, connection);
    EXPECT_FALSE(info.has_language);
    EXPECT_EQ(info.manufacturer, "Not Found");
    EXPECT_EQ(std::count(state->calls.begin(), state->calls.end(), "string 1"),
              0);
}

TEST_F(Info, LanguageQueryFailureSkipsStrings) {
    state->strings[2] = "Keypad";
    state->languages_result = LIBUSB_ERROR_PIPE;

    DeviceInfo info = ReadDeviceInfo(device, connection);
    EXPECT_FALSE(info.has_language);
    EXPECT_EQ(info.product, "Not Found");
}

TEST_F(Info, PrintsLanguage) {
    state->strings[2] = "Keypad";
    DeviceInfo info = ReadDeviceInfo(device, connection);

    ::testing::internal::CaptureStdout();
    PrintDeviceInfo(info);
    std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("Language: 0x0409\n"), std::string::npos);
    EXPECT_NE(output.find("Manufacturer: Not Found\n"), std::string::npos);
    EXPECT_NE(output.find("Product: Keypad\n"), std::string::npos);
}

TEST_F(Info, PrintsNoStringsWithoutLanguage) {
    state->languages.clear();
    DeviceInfo info = ReadDeviceInfo(device, connection);

    ::testing::internal::CaptureStdout();
    PrintDeviceInfo(info);
    std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("Active configuration: 1\n"), std::string::npos);
    EXPECT_EQ(output.find("Language:"), std::string::npos);
    EXPECT_EQ(output.find("Manufacturer:"), std::string::npos);
}

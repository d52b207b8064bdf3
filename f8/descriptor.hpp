/**
 * f8report, a report reader for the Falcon-8 USB peripheral
 *
 * Inspired / based on:
 *     the usbselfserial project made in C++,
 *         * by lotuspar (https://github.com/lotuspar)
 *         * https://github.com/gio3k/usbselfserial
 *     the libusb-1.0 API,
 *         * https://libusb.sourceforge.io/api-1.0/
 *     and the Linux USB chapter 9 definitions
 *         * https://github.com/torvalds/linux/blob/master/include/uapi/linux/usb/ch9.h
 * Device access layer written in C++ for f8report!
 *     * (by the time you read this it could have a different name!)
 * - 2026
 */
#pragma once
#include <stdint.h>
#include <vector>

namespace f8 {

/**
 * Copies of the libusb descriptor tree, so nothing here needs freeing
 */
struct DeviceDescriptorData {
    uint16_t vid = 0, pid = 0;
    uint8_t manufacturer_index = 0, product_index = 0, serial_number_index = 0;
    uint8_t num_configurations = 0;
};

struct EndpointDescriptorData {
    uint8_t address = 0;
    uint8_t attributes = 0;
    uint16_t max_packet_size = 0;
};

struct AltSettingData {
    uint8_t interface_number = 0;
    uint8_t alternate_setting = 0;
    uint8_t interface_class = 0;
    std::vector<EndpointDescriptorData> endpoints;
};

struct InterfaceData {
    std::vector<AltSettingData> altsettings;
};

struct ConfigDescriptorData {
    uint8_t configuration_value = 0;
    std::vector<InterfaceData> interfaces;
};

/**
 * One endpoint found while walking a configuration descriptor
 */
struct Endpoint {
    uint8_t config_value;
    uint8_t interface_number;
    uint8_t alternate_setting;
    uint8_t address;
};

inline bool operator==(const Endpoint& a, const Endpoint& b) {
    return a.config_value == b.config_value &&
           a.interface_number == b.interface_number &&
           a.alternate_setting == b.alternate_setting && a.address == b.address;
}

} // namespace f8

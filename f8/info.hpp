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
#include "connection.hpp"
#include "descriptor.hpp"
#include "error.hpp"
#include <cstdio>
#include <string>
#include <vector>

namespace f8 {

constexpr const char* const NotFoundString = "Not Found";

struct DeviceInfo {
    int active_configuration = 0;
    uint16_t vid = 0, pid = 0;
    // First language ID; strings are only read when there is one
    bool has_language = false;
    uint16_t language = 0;
    std::string manufacturer = NotFoundString;
    std::string product = NotFoundString;
    std::string serial_number = NotFoundString;
};

inline std::string ReadStringOrNotFound(BaseConnection& connection,
                                        uint8_t desc_index) {
    if (desc_index == 0)
        return NotFoundString;
    std::string value;
    if (connection.GetStringDescriptorAscii(desc_index, value) < 0)
        return NotFoundString;
    return value;
}

/**
 * Read the human readable bits of a device.
 * Missing strings become "Not Found", and so does every string when the
 * device reports no language. Only the descriptor and active configuration
 * queries can fail.
 */
inline DeviceInfo ReadDeviceInfo(BaseUsbDevice& device,
                                 BaseConnection& connection) {
    DeviceInfo info;
    DeviceDescriptorData descriptor;

    int ret = device.GetDeviceDescriptor(descriptor);
    if (ret < 0)
        throw error::DeviceUnavailableException(
            "Couldn't get device descriptor", ret);

    ret = connection.GetActiveConfiguration(info.active_configuration);
    if (ret < 0)
        throw error::DeviceUnavailableException(
            "Couldn't get active configuration", ret);

    info.vid = descriptor.vid;
    info.pid = descriptor.pid;

    std::vector<uint16_t> languages;
    if (connection.GetLanguages(languages) < 0 || languages.empty())
        return info;

    info.has_language = true;
    info.language = languages.front();
    info.manufacturer =
        ReadStringOrNotFound(connection, descriptor.manufacturer_index);
    info.product = ReadStringOrNotFound(connection, descriptor.product_index);
    info.serial_number =
        ReadStringOrNotFound(connection, descriptor.serial_number_index);
    return info;
}

inline void PrintDeviceInfo(const DeviceInfo& info) {
    printf("Device %04x:%04x\n", info.vid, info.pid);
    printf("Active configuration: %i\n", info.active_configuration);
    if (!info.has_language)
        return;

    printf("Language: 0x%04x\n", info.language);
    printf("Manufacturer: %s\n", info.manufacturer.c_str());
    printf("Product: %s\n", info.product.c_str());
    printf("Serial Number: %s\n", info.serial_number.c_str());
}

} // namespace f8

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
#include "log.hpp"
#include <vector>

namespace f8 {

/**
 * Read configuration descriptor 0 of a device
 * @throws error::DeviceUnavailableException if there is none
 */
inline ConfigDescriptorData ReadFirstConfig(BaseUsbDevice& device) {
    ConfigDescriptorData config;
    int ret = device.GetConfigDescriptor(0, config);
    if (ret < 0)
        throw error::DeviceUnavailableException(
            "Couldn't get configuration descriptor 0", ret);
    return config;
}

/**
 * Flatten a configuration into endpoint records.
 * Order is interface, then alternate setting, then endpoint, as declared.
 */
inline std::vector<Endpoint> WalkEndpoints(const ConfigDescriptorData& config) {
    std::vector<Endpoint> endpoints;

    // For each interface..
    for (const InterfaceData& interface : config.interfaces) {
        // For each alternate setting of the interface..
        for (const AltSettingData& altsetting : interface.altsettings) {
            // For each endpoint of the alternate setting..
            for (const EndpointDescriptorData& endpoint_descriptor :
                 altsetting.endpoints) {
                endpoints.push_back({config.configuration_value,
                                     altsetting.interface_number,
                                     altsetting.alternate_setting,
                                     endpoint_descriptor.address});
            }
        }
    }

    return endpoints;
}

inline std::vector<Endpoint> FindEndpoints(BaseUsbDevice& device) {
    std::vector<Endpoint> endpoints = WalkEndpoints(ReadFirstConfig(device));

    for (const Endpoint& endpoint : endpoints)
        log::Trace("endpoint cfg:%i, if:%i, alt:%i, addr:0x%02x\n",
                   endpoint.config_value, endpoint.interface_number,
                   endpoint.alternate_setting, endpoint.address);

    return endpoints;
}

} // namespace f8

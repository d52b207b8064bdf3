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
#include "descriptor.hpp"
#include <memory>
#include <stdint.h>
#include <string>
#include <vector>

namespace f8 {

/**
 * An opened device handle.
 * All calls return libusb codes: LIBUSB_SUCCESS, a byte count or a negative
 * LIBUSB_ERROR_*.
 */
class BaseConnection {
public:
    virtual ~BaseConnection() {}

    virtual int KernelDriverActive(uint8_t interface_number) = 0;
    virtual int DetachKernelDriver(uint8_t interface_number) = 0;
    virtual int AttachKernelDriver(uint8_t interface_number) = 0;
    virtual int ClaimInterface(uint8_t interface_number) = 0;
    virtual int ReleaseInterface(uint8_t interface_number) = 0;

    virtual int ControlTransfer(uint8_t request_type, uint8_t request,
                                uint16_t value, uint16_t index, uint8_t* data,
                                uint16_t length, uint32_t timeout) = 0;

    virtual int GetActiveConfiguration(int& config) = 0;
    // Language IDs from string descriptor 0
    virtual int GetLanguages(std::vector<uint16_t>& out) = 0;
    virtual int GetStringDescriptorAscii(uint8_t desc_index,
                                         std::string& out) = 0;
};

/**
 * A device seen during enumeration, not opened yet
 */
class BaseUsbDevice {
public:
    virtual ~BaseUsbDevice() {}

    virtual int GetDeviceDescriptor(DeviceDescriptorData& out) = 0;
    virtual int GetConfigDescriptor(uint8_t config_index,
                                    ConfigDescriptorData& out) = 0;
    virtual int Open(std::unique_ptr<BaseConnection>& out) = 0;

    virtual uint8_t GetBusNumber() = 0;
    virtual uint8_t GetAddress() = 0;
};

/**
 * Root of enumeration. Must outlive every device and session taken from it.
 */
class BaseContext {
public:
    virtual ~BaseContext() {}

    /**
     * List every device visible to the host
     * @throws error::LibUsbErrorException if the list can't be read
     */
    virtual std::vector<std::unique_ptr<BaseUsbDevice>> GetDevices() = 0;
};

} // namespace f8

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
// Mostly defines from linux/include/uapi/linux/usb/ch9.h
#pragma once
#include <stdint.h>

#ifndef F8_DEFAULT_VENDOR_ID
#define F8_DEFAULT_VENDOR_ID 0x0000
#endif

#ifndef F8_DEFAULT_PRODUCT_ID
#define F8_DEFAULT_PRODUCT_ID 0x0000
#endif

#ifndef F8_REPORT_LENGTH
#define F8_REPORT_LENGTH 64
#endif

namespace f8 {

struct DeviceIdentity {
    uint16_t vid;
    uint16_t pid;
};

namespace usbvars {

constexpr const uint8_t UsbDirIn = 0x80;
constexpr const uint8_t UsbTypeClass = (0x01 << 5);
constexpr const uint8_t UsbRecipInterface = 0x01;

// Report request (device -> host, class, interface)
constexpr const uint8_t ReportRequestType =
    (UsbDirIn | UsbTypeClass | UsbRecipInterface);
constexpr const uint8_t ReportRequest = 0x01;
constexpr const uint16_t ReportValue = 0x0307;
constexpr const uint16_t ReportIndex = 0x0002;

constexpr const uint32_t ControlTransferTimeout = 1000;

constexpr const DeviceIdentity DefaultIdentity = {F8_DEFAULT_VENDOR_ID,
                                                  F8_DEFAULT_PRODUCT_ID};
constexpr const uint16_t DefaultReportLength = F8_REPORT_LENGTH;

} // namespace usbvars
} // namespace f8

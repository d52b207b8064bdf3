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
#include "error.hpp"
#include "log.hpp"
#include <cstdio>
#include <exception>
#include <libusb-1.0/libusb.h>

namespace f8 {

inline void ClaimInterface(BaseConnection& connection,
                           uint8_t interface_number) {
    int ret = connection.ClaimInterface(interface_number);
    if (ret != 0) {
        printf("Failed to claim interface %i, code %i (%s)\n",
               interface_number, ret, libusb_error_name(ret));
        error::ThrowDriverError("Claim interface", ret);
    }
    log::Trace("Claimed interface %i\n", interface_number);
}

inline void ReleaseInterface(BaseConnection& connection,
                             uint8_t interface_number) {
    int ret = connection.ReleaseInterface(interface_number);
    if (ret != 0)
        error::ThrowDriverError("Release interface", ret);
    log::Trace("Released interface %i\n", interface_number);
}

/**
 * Holds an interface claim; released exactly once, by Release() or on
 * destruction
 */
class InterfaceClaimGuard {
    BaseConnection& connection;
    uint8_t interface_number;
    bool claimed = false;

public:
    InterfaceClaimGuard(BaseConnection& _connection, uint8_t _interface_number)
        : connection(_connection), interface_number(_interface_number) {
        ClaimInterface(connection, interface_number);
        claimed = true;
    }

    InterfaceClaimGuard(const InterfaceClaimGuard&) = delete;
    InterfaceClaimGuard& operator=(const InterfaceClaimGuard&) = delete;

    ~InterfaceClaimGuard() {
        if (!claimed)
            return;
        try {
            Release();
        } catch (const std::exception& e) {
            printf("Cleanup: failed to release interface %i (%s)\n",
                   interface_number, e.what());
        }
    }

    /**
     * Release now, reporting failure
     * @throws error::DriverException
     */
    void Release() {
        if (!claimed)
            return;
        claimed = false;
        ReleaseInterface(connection, interface_number);
    }

    bool Claimed() const { return claimed; }
};

} // namespace f8

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
#include <cstdio>
#include <exception>
#include <libusb-1.0/libusb.h>

namespace f8 {

enum class DriverBindingState : int { NotBound = 0, BoundByOs, DetachedByUs };

inline const char* DriverBindingStateName(DriverBindingState state) {
    switch (state) {
    case DriverBindingState::NotBound:
        return "NotBound";
    case DriverBindingState::BoundByOs:
        return "BoundByOs";
    case DriverBindingState::DetachedByUs:
        return "DetachedByUs";
    }
    return "Unknown";
}

/**
 * Detach the kernel driver from the endpoint's interface if one is active.
 * A failed query counts as no driver.
 * @param allow_detach When false a bound driver is left alone
 * @return DriverBindingState State to hand to ReattachIfNeeded
 */
inline DriverBindingState DetachIfBound(BaseConnection& connection,
                                        const Endpoint& endpoint,
                                        bool allow_detach = true) {
    int ret = connection.KernelDriverActive(endpoint.interface_number);
    if (ret < 0) {
        log::Trace(
            "Kernel driver query failed on interface %i, code %i (%s)\n",
            endpoint.interface_number, ret, libusb_error_name(ret));
        return DriverBindingState::NotBound;
    }
    if (ret == 0)
        return DriverBindingState::NotBound;
    if (!allow_detach)
        return DriverBindingState::BoundByOs;

    ret = connection.DetachKernelDriver(endpoint.interface_number);
    if (ret != 0) {
        printf("Failed to detach kernel driver from interface %i, code %i "
               "(%s)\n",
               endpoint.interface_number, ret, libusb_error_name(ret));
        error::ThrowDriverError("Detach kernel driver", ret);
    }

    log::Trace("Detached kernel driver from interface %i\n",
               endpoint.interface_number);
    return DriverBindingState::DetachedByUs;
}

/**
 * Give the interface back to the kernel driver if we took it.
 * @return DriverBindingState State after the call
 */
inline DriverBindingState ReattachIfNeeded(BaseConnection& connection,
                                           const Endpoint& endpoint,
                                           DriverBindingState prior_state) {
    if (prior_state != DriverBindingState::DetachedByUs)
        return prior_state;

    int ret = connection.AttachKernelDriver(endpoint.interface_number);
    if (ret != 0)
        error::ThrowDriverError("Reattach kernel driver", ret);

    log::Trace("Reattached kernel driver to interface %i\n",
               endpoint.interface_number);
    return DriverBindingState::BoundByOs;
}

/**
 * Detaches on construction, reattaches on Reattach() or destruction
 */
class ScopedDriverDetach {
    BaseConnection& connection;
    Endpoint endpoint;
    DriverBindingState state;

public:
    ScopedDriverDetach(BaseConnection& _connection, const Endpoint& _endpoint,
                       bool allow_detach = true)
        : connection(_connection), endpoint(_endpoint),
          state(DetachIfBound(_connection, _endpoint, allow_detach)) {}

    ScopedDriverDetach(const ScopedDriverDetach&) = delete;
    ScopedDriverDetach& operator=(const ScopedDriverDetach&) = delete;

    ~ScopedDriverDetach() {
        if (state != DriverBindingState::DetachedByUs)
            return;
        try {
            Reattach();
        } catch (const std::exception& e) {
            printf("Cleanup: failed to reattach kernel driver to interface "
                   "%i (%s)\n",
                   endpoint.interface_number, e.what());
        }
    }

    /**
     * Reattach now, reporting failure
     * @throws error::DriverException
     */
    void Reattach() {
        DriverBindingState prior = state;
        // Only one attempt, even if it throws
        state = DriverBindingState::NotBound;
        state = ReattachIfNeeded(connection, endpoint, prior);
    }

    DriverBindingState State() const { return state; }
};

} // namespace f8

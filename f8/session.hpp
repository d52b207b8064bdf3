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
#include "info.hpp"
#include "log.hpp"
#include "report.hpp"
#include "usbvars.hpp"
#include "walker.hpp"
#include <cstdio>
#include <memory>
#include <mutex>
#include <vector>

namespace f8 {

/**
 * One opened physical device.
 * The context is borrowed and must outlive the session. Report reads on one
 * session are serialised.
 */
class DeviceSession {
    BaseContext& context;
    std::unique_ptr<BaseUsbDevice> device;
    std::unique_ptr<BaseConnection> connection;
    std::mutex read_mutex;

public:
    DeviceSession(BaseContext& _context, std::unique_ptr<BaseUsbDevice> _device,
                  std::unique_ptr<BaseConnection> _connection)
        : context(_context), device(std::move(_device)),
          connection(std::move(_connection)) {}

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    ~DeviceSession() {
        // Close the handle before dropping the device reference
        connection.reset();
        device.reset();
    }

    std::vector<Endpoint> FindEndpoints() { return f8::FindEndpoints(*device); }

    std::vector<uint8_t> ReadReport(const ReportReadPolicy& policy = {}) {
        std::lock_guard<std::mutex> lock(read_mutex);
        return f8::ReadReport(*device, *connection, policy);
    }

    DeviceInfo ReadInfo() { return ReadDeviceInfo(*device, *connection); }
    void PrintInfo() { PrintDeviceInfo(ReadInfo()); }

    BaseContext& GetContext() { return context; }
    BaseUsbDevice& GetUsbDevice() { return *device; }
    BaseConnection& GetConnection() { return *connection; }
};

/**
 * Open a session for every device matching identity.
 * Devices without a descriptor or that fail to open are skipped.
 * @throws error::NoDeviceException if nothing could be opened
 */
inline std::vector<std::unique_ptr<DeviceSession>>
DiscoverSessions(BaseContext& context,
                 DeviceIdentity identity = usbvars::DefaultIdentity) {
    std::vector<std::unique_ptr<DeviceSession>> sessions;

    for (std::unique_ptr<BaseUsbDevice>& device : context.GetDevices()) {
        DeviceDescriptorData descriptor;
        if (device->GetDeviceDescriptor(descriptor) < 0)
            continue;

        if (descriptor.vid != identity.vid || descriptor.pid != identity.pid)
            continue;

        std::unique_ptr<BaseConnection> connection;
        int ret = device->Open(connection);
        if (ret < 0 || connection == NULL) {
            printf("Failed to open %04x:%04x on bus %i address %i, code %i "
                   "(%s)\n",
                   identity.vid, identity.pid, device->GetBusNumber(),
                   device->GetAddress(), ret, libusb_error_name(ret));
            continue;
        }

        sessions.emplace_back(new DeviceSession(context, std::move(device),
                                                std::move(connection)));
    }

    if (sessions.empty())
        throw error::NoDeviceException();

    return sessions;
}

} // namespace f8

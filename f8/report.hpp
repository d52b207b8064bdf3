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
#include "binding.hpp"
#include "claim.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "log.hpp"
#include "usbvars.hpp"
#include "walker.hpp"
#include <cstdio>
#include <libusb-1.0/libusb.h>
#include <string>
#include <vector>

namespace f8 {

/**
 * Which interface / endpoint the report is read through, and how.
 * The request fields themselves are fixed in usbvars.
 */
struct ReportReadPolicy {
    uint8_t interface_index = 0;
    uint8_t endpoint_index = 0;
    uint16_t report_length = usbvars::DefaultReportLength;
    uint32_t timeout = usbvars::ControlTransferTimeout;
    bool detach_kernel_driver = true;
};

inline void ValidatePolicy(const ReportReadPolicy& policy) {
    if (policy.report_length == 0)
        throw error::InvalidConfigException("report_length",
                                            policy.report_length);
    if (policy.timeout == 0)
        throw error::InvalidConfigException("timeout", policy.timeout);
}

struct ReportTarget {
    Endpoint endpoint;
    uint8_t claim_interface;
};

/**
 * Pick what the report is read through.
 * The endpoint is the endpoint_index-th of the whole walk; its interface is
 * the one detached. The claimed interface is the one at interface_index of
 * the configuration (its first alternate setting gives the number).
 */
inline ReportTarget SelectTarget(const ConfigDescriptorData& config,
                                 const ReportReadPolicy& policy) {
    std::vector<Endpoint> endpoints = WalkEndpoints(config);
    if (endpoints.empty())
        throw error::NoEndpointsException("device exposes no endpoints");

    if (policy.endpoint_index >= endpoints.size())
        throw error::NoEndpointsException(
            "no endpoint at index " + std::to_string(policy.endpoint_index));

    if (policy.interface_index >= config.interfaces.size() ||
        config.interfaces[policy.interface_index].altsettings.empty())
        throw error::NoEndpointsException(
            "no interface at index " + std::to_string(policy.interface_index));

    return {endpoints[policy.endpoint_index],
            config.interfaces[policy.interface_index]
                .altsettings.front()
                .interface_number};
}

/**
 * Read the device report.
 * Detach, claim, transfer, release, reattach. Release and reattach run on
 * every exit path; the first error wins and later cleanup errors are only
 * printed.
 * @return std::vector<uint8_t> Bytes the device actually sent
 */
inline std::vector<uint8_t> ReadReport(BaseUsbDevice& device,
                                       BaseConnection& connection,
                                       const ReportReadPolicy& policy = {}) {
    ValidatePolicy(policy);

    ReportTarget target = SelectTarget(ReadFirstConfig(device), policy);
    log::Trace("Using endpoint 0x%02x on interface %i, claiming %i\n",
               target.endpoint.address, target.endpoint.interface_number,
               target.claim_interface);

    ScopedDriverDetach detach(connection, target.endpoint,
                              policy.detach_kernel_driver);
    InterfaceClaimGuard claim(connection, target.claim_interface);

    std::vector<uint8_t> report(policy.report_length);
    int ret = connection.ControlTransfer(
        usbvars::ReportRequestType, usbvars::ReportRequest,
        usbvars::ReportValue, usbvars::ReportIndex, report.data(),
        policy.report_length, policy.timeout);
    if (ret < 0) {
        printf("Report transfer failed, code %i (%s)\n", ret,
               libusb_error_name(ret));
        throw error::TransferException("Report control transfer", ret);
    }

    log::Trace("Report size: %i\n", ret);
    report.resize(ret);

    claim.Release();
    detach.Reattach();
    return report;
}

} // namespace f8

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
#include <exception>
#include <libusb-1.0/libusb.h>
#include <string>

namespace f8 {
namespace error {

enum class ErrorKind : int {
    NotFound = 0,
    DeviceUnavailable,
    NoEndpoints,
    DriverError,
    TransferError,
    PermissionDenied,
    InvalidConfig
};

inline const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::DeviceUnavailable:
        return "DeviceUnavailable";
    case ErrorKind::NoEndpoints:
        return "NoEndpoints";
    case ErrorKind::DriverError:
        return "DriverError";
    case ErrorKind::TransferError:
        return "TransferError";
    case ErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ErrorKind::InvalidConfig:
        return "InvalidConfig";
    }
    return "Unknown";
}

/**
 * Base of every error thrown by f8
 */
class F8Exception : public std::exception {
    ErrorKind error_kind;
    int lusb_code;
    std::string msg;

public:
    F8Exception(ErrorKind kind, const std::string& message, int code = 0)
        : error_kind(kind), lusb_code(code), msg(message) {}

    const char* what() const throw() override { return msg.c_str(); }
    ErrorKind kind() const { return error_kind; }
    int code() const { return lusb_code; }
};

// Formats "<during>: <libusb error text>"
inline std::string LibUsbMessage(const std::string& during, int code) {
    return during + ": " + libusb_strerror((libusb_error)code);
}

class NoDeviceException : public F8Exception {
public:
    NoDeviceException()
        : F8Exception(ErrorKind::NotFound, "Device not found") {}
};

class DeviceUnavailableException : public F8Exception {
public:
    DeviceUnavailableException(const std::string& reason, int code = 0)
        : F8Exception(ErrorKind::DeviceUnavailable,
                      "Device unavailable: " + reason, code) {}
};

class NoEndpointsException : public F8Exception {
public:
    NoEndpointsException(const std::string& reason)
        : F8Exception(ErrorKind::NoEndpoints, "No endpoints: " + reason) {}
};

class DriverException : public F8Exception {
public:
    DriverException(const std::string& during, int code)
        : F8Exception(ErrorKind::DriverError, LibUsbMessage(during, code),
                      code) {}
};

class TransferException : public F8Exception {
public:
    TransferException(const std::string& during, int code)
        : F8Exception(ErrorKind::TransferError, LibUsbMessage(during, code),
                      code) {}

    bool IsTimeout() const { return code() == LIBUSB_ERROR_TIMEOUT; }
};

class PermissionDeniedException : public F8Exception {
public:
    PermissionDeniedException(const std::string& during, int code)
        : F8Exception(ErrorKind::PermissionDenied, LibUsbMessage(during, code),
                      code) {}
};

class InvalidConfigException : public F8Exception {
public:
    InvalidConfigException(const std::string& config_key, int value)
        : F8Exception(ErrorKind::InvalidConfig,
                      "Invalid value " + std::to_string(value) +
                          " for config key " + config_key) {}
};

class LibUsbErrorException : public F8Exception {
public:
    LibUsbErrorException(const std::string& during, int code)
        : F8Exception(ErrorKind::DeviceUnavailable,
                      LibUsbMessage(during, code), code) {}
};

/**
 * Throws the exception matching a failed claim / release / attach / detach
 * @param during What was being done
 * @param code libusb return code (negative)
 */
[[noreturn]] inline void ThrowDriverError(const std::string& during,
                                          int code) {
    if (code == LIBUSB_ERROR_ACCESS)
        throw PermissionDeniedException(during, code);
    throw DriverException(during, code);
}

} // namespace error
} // namespace f8

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
#include <atomic>
#include <cstdio>

namespace f8 {
namespace log {

inline std::atomic<bool>& VerboseFlag() {
    static std::atomic<bool> verbose(false);
    return verbose;
}

inline void SetVerbose(bool value) { VerboseFlag() = value; }
inline bool Verbose() { return VerboseFlag(); }

/**
 * Step trace, only printed when verbose
 * @param format printf format string
 */
template <typename... Args>
inline void Trace(const char* format, Args... args) {
    if (Verbose())
        printf(format, args...);
}

} // namespace log
} // namespace f8

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
#include "../../connection.hpp"
#include "../../descriptor.hpp"
#include "../../error.hpp"
#include <libusb-1.0/libusb.h>
#include <memory>
#include <string>
#include <vector>

namespace f8 {
namespace backends {
namespace libusb {

class LibUsbConnection : public BaseConnection {
    libusb_device_handle* usb_handle;

public:
    explicit LibUsbConnection(libusb_device_handle* _usb_handle)
        : usb_handle(_usb_handle) {}

    LibUsbConnection(const LibUsbConnection&) = delete;
    LibUsbConnection& operator=(const LibUsbConnection&) = delete;

    ~LibUsbConnection() { libusb_close(usb_handle); }

    int KernelDriverActive(uint8_t interface_number) override {
        return libusb_kernel_driver_active(usb_handle, interface_number);
    }

    int DetachKernelDriver(uint8_t interface_number) override {
        return libusb_detach_kernel_driver(usb_handle, interface_number);
    }

    int AttachKernelDriver(uint8_t interface_number) override {
        return libusb_attach_kernel_driver(usb_handle, interface_number);
    }

    int ClaimInterface(uint8_t interface_number) override {
        return libusb_claim_interface(usb_handle, interface_number);
    }

    int ReleaseInterface(uint8_t interface_number) override {
        return libusb_release_interface(usb_handle, interface_number);
    }

    int ControlTransfer(uint8_t request_type, uint8_t request, uint16_t value,
                        uint16_t index, uint8_t* data, uint16_t length,
                        uint32_t timeout) override {
        return libusb_control_transfer(usb_handle, request_type, request,
                                       value, index, data, length, timeout);
    }

    int GetActiveConfiguration(int& config) override {
        return libusb_get_configuration(usb_handle, &config);
    }

    int GetLanguages(std::vector<uint16_t>& out) override {
        unsigned char buffer[256];
        int ret = libusb_get_string_descriptor(usb_handle, 0, 0, buffer,
                                               sizeof(buffer));
        if (ret < 0)
            return ret;

        // bLength, bDescriptorType, then little endian wLANGID[]
        out.clear();
        for (int i = 2; i + 1 < ret && i + 1 < buffer[0]; i += 2)
            out.push_back(buffer[i] | (buffer[i + 1] << 8));
        return (int)out.size();
    }

    int GetStringDescriptorAscii(uint8_t desc_index,
                                 std::string& out) override {
        unsigned char buffer[256];
        int ret = libusb_get_string_descriptor_ascii(usb_handle, desc_index,
                                                     buffer, sizeof(buffer));
        if (ret < 0)
            return ret;
        out.assign((const char*)buffer, ret);
        return ret;
    }

    libusb_device_handle* GetUsbHandle() { return usb_handle; }
};

class LibUsbDevice : public BaseUsbDevice {
    libusb_device* usb_device;

public:
    // Takes its own reference on the device
    explicit LibUsbDevice(libusb_device* _usb_device)
        : usb_device(libusb_ref_device(_usb_device)) {}

    LibUsbDevice(const LibUsbDevice&) = delete;
    LibUsbDevice& operator=(const LibUsbDevice&) = delete;

    ~LibUsbDevice() { libusb_unref_device(usb_device); }

    int GetDeviceDescriptor(DeviceDescriptorData& out) override {
        libusb_device_descriptor device_descriptor;
        int ret = libusb_get_device_descriptor(usb_device, &device_descriptor);
        if (ret < 0)
            return ret;

        out.vid = device_descriptor.idVendor;
        out.pid = device_descriptor.idProduct;
        out.manufacturer_index = device_descriptor.iManufacturer;
        out.product_index = device_descriptor.iProduct;
        out.serial_number_index = device_descriptor.iSerialNumber;
        out.num_configurations = device_descriptor.bNumConfigurations;
        return LIBUSB_SUCCESS;
    }

    int GetConfigDescriptor(uint8_t config_index,
                            ConfigDescriptorData& out) override {
        libusb_config_descriptor* config_descriptor;
        const libusb_interface* interface;
        const libusb_interface_descriptor* interface_descriptor;
        const libusb_endpoint_descriptor* endpoint_descriptor;

        int ret = libusb_get_config_descriptor(usb_device, config_index,
                                               &config_descriptor);
        if (ret < 0)
            return ret;

        out.configuration_value = config_descriptor->bConfigurationValue;
        out.interfaces.clear();

        // For each interface.. (with the amount of them found in the
        // configuration descriptor)
        for (int ii = 0; ii < config_descriptor->bNumInterfaces; ii++) {
            interface = config_descriptor->interface + ii;
            InterfaceData interface_data;

            // For each alternate setting..
            for (int ia = 0; ia < interface->num_altsetting; ia++) {
                interface_descriptor = interface->altsetting + ia;
                AltSettingData altsetting;
                altsetting.interface_number =
                    interface_descriptor->bInterfaceNumber;
                altsetting.alternate_setting =
                    interface_descriptor->bAlternateSetting;
                altsetting.interface_class =
                    interface_descriptor->bInterfaceClass;

                // For each endpoint..
                for (int ie = 0; ie < interface_descriptor->bNumEndpoints;
                     ie++) {
                    endpoint_descriptor = interface_descriptor->endpoint + ie;
                    altsetting.endpoints.push_back(
                        {endpoint_descriptor->bEndpointAddress,
                         endpoint_descriptor->bmAttributes,
                         endpoint_descriptor->wMaxPacketSize});
                }

                interface_data.altsettings.push_back(altsetting);
            }

            out.interfaces.push_back(interface_data);
        }

        // Free configuration descriptor
        libusb_free_config_descriptor(config_descriptor);
        return LIBUSB_SUCCESS;
    }

    int Open(std::unique_ptr<BaseConnection>& out) override {
        libusb_device_handle* usb_handle = NULL;
        int ret = libusb_open(usb_device, &usb_handle);
        if (ret < 0)
            return ret;
        out.reset(new LibUsbConnection(usb_handle));
        return LIBUSB_SUCCESS;
    }

    uint8_t GetBusNumber() override {
        return libusb_get_bus_number(usb_device);
    }

    uint8_t GetAddress() override {
        return libusb_get_device_address(usb_device);
    }
};

/**
 * Owns a libusb context for the lifetime of the object
 */
class LibUsbContext : public BaseContext {
    libusb_context* usb_context = NULL;

public:
    LibUsbContext() {
        int ret = libusb_init(&usb_context);
        if (ret < 0)
            throw error::LibUsbErrorException("Failed to initialize libusb",
                                              ret);
    }

    LibUsbContext(const LibUsbContext&) = delete;
    LibUsbContext& operator=(const LibUsbContext&) = delete;

    ~LibUsbContext() { libusb_exit(usb_context); }

    std::vector<std::unique_ptr<BaseUsbDevice>> GetDevices() override {
        libusb_device** device_list = NULL;
        ssize_t device_count = libusb_get_device_list(usb_context, &device_list);
        if (device_count < 0)
            throw error::LibUsbErrorException("Failed to get device list",
                                              (int)device_count);

        std::vector<std::unique_ptr<BaseUsbDevice>> devices;
        for (ssize_t i = 0; i < device_count; i++)
            devices.emplace_back(new LibUsbDevice(device_list[i]));

        // Each LibUsbDevice holds its own reference
        libusb_free_device_list(device_list, 1);
        return devices;
    }

    libusb_context* GetUsbContext() { return usb_context; }
};

} // namespace libusb
} // namespace backends
} // namespace f8

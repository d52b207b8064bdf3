#include "f8/f8.hpp"
#include <argparse/argparse.hpp>
#include <cstdio>
#include <iostream>

using namespace f8;

static void PrintReport(const std::vector<uint8_t>& report) {
    for (size_t i = 0; i < report.size(); i += 16) {
        printf("%04zx:", i);
        for (size_t j = i; j < i + 16 && j < report.size(); j++)
            printf(" %02x", report[j]);
        printf("\n");
    }
    printf("-> %zu bytes\n", report.size());
}

int main(int argc, char** argv) {
    argparse::ArgumentParser program("f8report");

    program.add_argument("-v", "--vid", "--vendor-id")
        .default_value<uint16_t>(usbvars::DefaultIdentity.vid)
        .scan<'x', uint16_t>()
        .help("specify the USB vendor ID.");

    program.add_argument("-p", "--pid", "--product-id")
        .default_value<uint16_t>(usbvars::DefaultIdentity.pid)
        .scan<'x', uint16_t>()
        .help("specify the USB product ID.");

    program.add_argument("-l", "--length")
        .default_value<uint16_t>(usbvars::DefaultReportLength)
        .scan<'u', uint16_t>()
        .help("specify the report buffer length in bytes.");

    program.add_argument("--interface")
        .default_value<uint8_t>(0)
        .scan<'u', uint8_t>()
        .help("specify the interface index to read through.");

    program.add_argument("--endpoint")
        .default_value<uint8_t>(0)
        .scan<'u', uint8_t>()
        .help("specify the endpoint index within the interface.");

    program.add_argument("-t", "--timeout")
        .default_value<uint32_t>(usbvars::ControlTransferTimeout)
        .scan<'u', uint32_t>()
        .help("specify the control transfer timeout in milliseconds.");

    program.add_argument("--no-detach")
        .default_value(false)
        .implicit_value(true)
        .help("leave a bound kernel driver attached.");

    program.add_argument("-i", "--info")
        .default_value(false)
        .implicit_value(true)
        .help("print device strings before the report.");

    program.add_argument("--verbose")
        .default_value(false)
        .implicit_value(true)
        .help("print every step of the read.");

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    DeviceIdentity identity = {program.get<uint16_t>("--vid"),
                               program.get<uint16_t>("--pid")};

    ReportReadPolicy policy;
    policy.report_length = program.get<uint16_t>("--length");
    policy.interface_index = program.get<uint8_t>("--interface");
    policy.endpoint_index = program.get<uint8_t>("--endpoint");
    policy.timeout = program.get<uint32_t>("--timeout");
    policy.detach_kernel_driver = !program.get<bool>("--no-detach");
    bool arg_info = program.get<bool>("--info");

    f8::log::SetVerbose(program.get<bool>("--verbose"));

    try {
        ValidatePolicy(policy);
    } catch (const error::F8Exception& e) {
        printf("%s\n", e.what());
        return 1;
    }

    printf("-> device %04x:%04x, report length %i\n", identity.vid,
           identity.pid, policy.report_length);

    try {
        // Sessions are declared after the context so they are destroyed first
        backends::libusb::LibUsbContext context;
        std::vector<std::unique_ptr<DeviceSession>> sessions =
            DiscoverSessions(context, identity);

        int failed = 0;
        for (std::unique_ptr<DeviceSession>& session : sessions) {
            printf("Device on bus %i address %i\n",
                   session->GetUsbDevice().GetBusNumber(),
                   session->GetUsbDevice().GetAddress());
            try {
                if (arg_info)
                    session->PrintInfo();
                PrintReport(session->ReadReport(policy));
            } catch (const error::F8Exception& e) {
                printf("Failed to read report (%s): %s\n",
                       error::ErrorKindName(e.kind()), e.what());
                failed++;
            }
        }

        return failed ? 2 : 0;
    } catch (const error::F8Exception& e) {
        printf("%s: %s\n", error::ErrorKindName(e.kind()), e.what());
        return 1;
    }
}

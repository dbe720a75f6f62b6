#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "device/usb_device_factory.hpp"
#include "pnp/event_queue.hpp"
#include "pnp/fleet_manager.hpp"
#include "usb/libusb_transport.hpp"

namespace ippusb {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Initialize libusb and the device factory
    bool initialize(std::string &error);

    // Serve devices until terminated, or until none are left if exit_when_idle (blocking).
    // Returns false if hotplug monitoring or signal handling cannot be set up.
    bool run(bool exit_when_idle, pnp::ExitReason &reason, std::string &error);

    // One enumeration, no devices are opened
    bool check(std::vector<usb::UsbDeviceDesc> &descs, std::string &error);

    // Stop hotplug monitoring and restore signal dispositions
    void shutdown();

private:
    RuntimeConfig config_;

    std::unique_ptr<usb::LibUsbTransport> transport_;
    std::unique_ptr<device::UsbDeviceFactory> factory_;
    pnp::EventQueue events_;
};

}  // namespace runtime
}  // namespace ippusb

#pragma once

#include <libusb.h>

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "i_usb_transport.hpp"

namespace ippusb {
namespace usb {

// LibUsbTransport discovers IPP-over-USB devices through libusb-1.0
// Responsibilities:
// - Enumerate devices exposing at least two IPP-over-USB interfaces
// - Report hotplug arrivals/departures through a callback
// - Run the libusb event thread that delivers those callbacks
// - Open devices by address for the per-device bridge
class LibUsbTransport : public IUsbTransport {
public:
    using HotplugCallback = std::function<void()>;

    LibUsbTransport() = default;
    ~LibUsbTransport() override;

    LibUsbTransport(const LibUsbTransport &) = delete;
    LibUsbTransport &operator=(const LibUsbTransport &) = delete;

    // Initialize libusb. Required before any other call.
    bool init(std::string &error);

    // Register for hotplug notifications and start the event thread.
    // on_hotplug runs on the event thread and must not block.
    bool start_hotplug(HotplugCallback on_hotplug, std::string &error);

    // Deregister hotplug notifications and join the event thread. Safe to call multiple times.
    void stop();

    bool enumerate_devices(std::vector<UsbDeviceDesc> &descs, std::string &error) override;

    // Open the device currently attached at addr. Caller owns the handle.
    libusb_device_handle *open_device(const UsbAddr &addr, std::string &error);

private:
    static int LIBUSB_CALL on_hotplug_event(libusb_context *ctx, libusb_device *dev, libusb_hotplug_event event,
                                            void *user_data);
    void event_loop();

    // Fills desc if dev is IPP-over-USB capable
    static bool describe_device(libusb_device *dev, UsbDeviceDesc &desc);

    libusb_context *ctx_ = nullptr;
    libusb_hotplug_callback_handle hotplug_handle_ = 0;
    bool hotplug_registered_ = false;
    HotplugCallback on_hotplug_;

    std::thread event_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace usb
}  // namespace ippusb

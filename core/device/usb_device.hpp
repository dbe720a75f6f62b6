#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <libusb.h>

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <httplib.h>

#include "i_device.hpp"
#include "runtime/config.hpp"
#include "usb/usb_types.hpp"

namespace ippusb {
namespace device {

/**
 * @brief Bridge instance for one attached IPP-over-USB device
 *
 * Owns the libusb handle with its claimed interfaces and an HTTP listener on
 * a dedicated port. The listener answers GET /ippusb/status; every other
 * request, whatever its method, is rejected with 503 (see listener_routes.hpp).
 *
 * Thread model:
 * - Listener runs in its own thread (httplib::Server::listen_after_bind)
 * - shutdown()/close() are called by one owner at a time (loop or shutdown task)
 * - Request handlers only read immutable members and the atomic state
 *
 * Lifecycle:
 * - open() claims interfaces, binds the first free port, starts the listener -> ACTIVE
 * - shutdown() stops the listener and waits for it until the deadline -> SHUTTING_DOWN
 * - close() releases everything -> CLOSED
 */
class UsbDevice : public IDevice {
public:
    /**
     * @brief Bring up the bridge for an opened device
     *
     * Takes ownership of handle, also on failure.
     *
     * @return nullptr and error set if an interface is busy or no port is free
     */
    static std::unique_ptr<UsbDevice> open(libusb_device_handle *handle, const usb::UsbDeviceDesc &desc,
                                           const runtime::NetworkConfig &network, std::string &error);

    ~UsbDevice() override;

    UsbDevice(const UsbDevice &) = delete;
    UsbDevice &operator=(const UsbDevice &) = delete;

    const usb::UsbAddr &addr() const override { return addr_; }
    void shutdown(Deadline deadline) override;
    void close() override;

    DeviceState state() const { return state_.load(); }
    int port() const { return port_; }

private:
    UsbDevice(libusb_device_handle *handle, const usb::UsbDeviceDesc &desc);

    bool claim_interfaces(std::string &error);
    void release_interfaces();

    bool start_listener(const runtime::NetworkConfig &network, std::string &error);
    void stop_listener();
    void setup_routes();

    void handle_request(const httplib::Request &req, httplib::Response &res);
    void handle_get_status(const httplib::Request &req, httplib::Response &res);
    void handle_unavailable(const httplib::Request &req, httplib::Response &res);

    std::string log_prefix() const;

    const usb::UsbAddr addr_;
    const uint16_t vendor_id_;
    const uint16_t product_id_;
    const std::vector<usb::UsbIppInterface> interfaces_;

    libusb_device_handle *handle_;
    std::vector<uint8_t> claimed_;   // Interface numbers to release
    std::vector<uint8_t> detached_;  // Interface numbers to give back to the kernel driver

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::promise<void> listener_done_;
    std::future<void> listener_exited_;
    int port_ = 0;

    std::atomic<DeviceState> state_{DeviceState::CREATED};
};

}  // namespace device
}  // namespace ippusb

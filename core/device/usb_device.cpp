#include "usb_device.hpp"

#include <nlohmann/json.hpp>

#include <utility>

#include "listener_routes.hpp"
#include "logging/logger.hpp"

namespace ippusb {
namespace device {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;

// Every response body carries {"status": {"code": ..., "message": ...}}
nlohmann::json make_status(const std::string &code, const std::string &message) {
    return {{"code", code}, {"message", message}};
}

void send_json_error(httplib::Response &res, int http_status, const std::string &code, const std::string &message) {
    nlohmann::json response = {{"status", make_status(code, message)}};
    res.status = http_status;
    res.set_content(response.dump(), "application/json");
}
}  // namespace

std::unique_ptr<UsbDevice> UsbDevice::open(libusb_device_handle *handle, const usb::UsbDeviceDesc &desc,
                                           const runtime::NetworkConfig &network, std::string &error) {
    // Private constructor, no make_unique
    std::unique_ptr<UsbDevice> dev(new UsbDevice(handle, desc));

    if (!dev->claim_interfaces(error) || !dev->start_listener(network, error)) {
        dev->close();
        return nullptr;
    }

    dev->state_.store(DeviceState::ACTIVE);
    LOG_INFO(dev->log_prefix() << " " << usb::format_usb_id(dev->vendor_id_) << ":"
                               << usb::format_usb_id(dev->product_id_) << " serving on " << network.bind_address()
                               << ":" << dev->port_);
    return dev;
}

UsbDevice::UsbDevice(libusb_device_handle *handle, const usb::UsbDeviceDesc &desc)
    : addr_(desc.addr),
      vendor_id_(desc.vendor_id),
      product_id_(desc.product_id),
      interfaces_(desc.interfaces),
      handle_(handle) {}

UsbDevice::~UsbDevice() { close(); }

std::string UsbDevice::log_prefix() const { return "[Device " + addr_.to_string() + "]"; }

bool UsbDevice::claim_interfaces(std::string &error) {
    for (const auto &iface : interfaces_) {
        const int num = iface.number;

        // 1 = attached, 0 = not attached, LIBUSB_ERROR_NOT_SUPPORTED on platforms without kernel drivers
        if (libusb_kernel_driver_active(handle_, num) == 1) {
            int rc = libusb_detach_kernel_driver(handle_, num);
            if (rc != LIBUSB_SUCCESS) {
                error = "interface " + std::to_string(num) + ": detach kernel driver failed: " + libusb_error_name(rc);
                return false;
            }
            detached_.push_back(iface.number);
        }

        int rc = libusb_claim_interface(handle_, num);
        if (rc == LIBUSB_ERROR_BUSY) {
            error = "interface " + std::to_string(num) + " is busy";
            return false;
        }
        if (rc != LIBUSB_SUCCESS) {
            error = "interface " + std::to_string(num) + ": claim failed: " + libusb_error_name(rc);
            return false;
        }
        claimed_.push_back(iface.number);

        if (iface.alt_setting != 0) {
            rc = libusb_set_interface_alt_setting(handle_, num, iface.alt_setting);
            if (rc != LIBUSB_SUCCESS) {
                error = "interface " + std::to_string(num) + ": set alt setting " +
                        std::to_string(iface.alt_setting) + " failed: " + libusb_error_name(rc);
                return false;
            }
        }
    }

    LOG_DEBUG(log_prefix() << " Claimed " << claimed_.size() << " interfaces");
    return true;
}

void UsbDevice::release_interfaces() {
    for (uint8_t num : claimed_) {
        int rc = libusb_release_interface(handle_, num);
        // Device already unplugged is the common case here
        if (rc != LIBUSB_SUCCESS && rc != LIBUSB_ERROR_NO_DEVICE) {
            LOG_WARN(log_prefix() << " Release interface " << static_cast<int>(num)
                                  << " failed: " << libusb_error_name(rc));
        }
    }
    claimed_.clear();

    for (uint8_t num : detached_) {
        int rc = libusb_attach_kernel_driver(handle_, num);
        if (rc != LIBUSB_SUCCESS && rc != LIBUSB_ERROR_NO_DEVICE) {
            LOG_WARN(log_prefix() << " Reattach kernel driver to interface " << static_cast<int>(num)
                                  << " failed: " << libusb_error_name(rc));
        }
    }
    detached_.clear();
}

bool UsbDevice::start_listener(const runtime::NetworkConfig &network, std::string &error) {
    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    setup_routes();

    // Only override content if no content has been set
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        // Status stays what httplib decided (e.g. 400 for a malformed request)
        if (res.status == kStatusNotFound) {
            send_json_error(res, res.status, "NOT_FOUND", "Route not found: " + req.method + " " + req.path);
        } else {
            send_json_error(res, res.status, "INTERNAL", "Request failed");
        }
    });

    server_->set_exception_handler([this](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR(log_prefix() << " HTTP handler exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR(log_prefix() << " HTTP handler unknown exception");
        }

        send_json_error(res, kStatusInternal, "INTERNAL", msg);
    });

    const std::string bind = network.bind_address();
    for (int port = network.http_min_port; port <= network.http_max_port; ++port) {
        if (server_->bind_to_port(bind, port)) {
            port_ = port;
            break;
        }
    }

    if (port_ == 0) {
        error = "no free HTTP port in " + std::to_string(network.http_min_port) + "-" +
                std::to_string(network.http_max_port) + " on " + bind;
        server_.reset();
        return false;
    }

    listener_exited_ = listener_done_.get_future();
    server_thread_ = std::thread([this]() {
        LOG_DEBUG(log_prefix() << " Listener thread started");
        server_->listen_after_bind();
        LOG_DEBUG(log_prefix() << " Listener thread exiting");
        listener_done_.set_value();
    });

    // stop() is a no-op until the server runs
    server_->wait_until_ready();
    return true;
}

void UsbDevice::stop_listener() {
    if (server_) {
        server_->stop();
    }
}

void UsbDevice::setup_routes() {
    // GET /ippusb/status - Device address, ids, port and lifecycle state
    // Everything else, on every method, is answered with 503
    auto dispatch = [this](const httplib::Request &req, httplib::Response &res) { handle_request(req, res); };

    server_->Get(R"(/.*)", dispatch);
    server_->Post(R"(/.*)", dispatch);
    server_->Put(R"(/.*)", dispatch);
    server_->Delete(R"(/.*)", dispatch);
    server_->Patch(R"(/.*)", dispatch);
    server_->Options(R"(/.*)", dispatch);
}

void UsbDevice::handle_request(const httplib::Request &req, httplib::Response &res) {
    const ListenerRoute route = classify_request(req.method, req.path);
    LOG_DEBUG(log_prefix() << " " << req.method << " " << req.path << " -> " << listener_route_to_string(route));

    switch (route) {
        case ListenerRoute::STATUS:
            handle_get_status(req, res);
            break;
        case ListenerRoute::UNAVAILABLE:
        default:
            handle_unavailable(req, res);
            break;
    }
}

void UsbDevice::handle_get_status(const httplib::Request &, httplib::Response &res) {
    nlohmann::json device = {{"address", addr_.to_string()},
                             {"bus", addr_.bus},
                             {"device", addr_.address},
                             {"vendor_id", usb::format_usb_id(vendor_id_)},
                             {"product_id", usb::format_usb_id(product_id_)},
                             {"interfaces", interfaces_.size()},
                             {"port", port_},
                             {"state", device_state_to_string(state_.load())}};

    nlohmann::json response = {{"status", make_status("OK", "ok")}, {"device", device}};
    res.status = route_http_status(ListenerRoute::STATUS);
    res.set_content(response.dump(), "application/json");
}

void UsbDevice::handle_unavailable(const httplib::Request &, httplib::Response &res) {
    send_json_error(res, route_http_status(ListenerRoute::UNAVAILABLE), "UNAVAILABLE",
                    "Request forwarding to the device is not available");
}

void UsbDevice::shutdown(Deadline deadline) {
    DeviceState current = state_.load();
    if (current == DeviceState::CLOSED || current == DeviceState::SHUTTING_DOWN) {
        return;
    }

    state_.store(DeviceState::SHUTTING_DOWN);
    LOG_DEBUG(log_prefix() << " Shutting down");

    stop_listener();

    if (listener_exited_.valid() && listener_exited_.wait_until(deadline) != std::future_status::ready) {
        LOG_WARN(log_prefix() << " Listener still running at shutdown deadline");
    }
}

void UsbDevice::close() {
    if (state_.load() == DeviceState::CLOSED) {
        return;
    }

    stop_listener();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    server_.reset();

    if (handle_) {
        release_interfaces();
        libusb_close(handle_);
        handle_ = nullptr;
    }

    state_.store(DeviceState::CLOSED);
    LOG_DEBUG(log_prefix() << " Closed");
}

}  // namespace device
}  // namespace ippusb

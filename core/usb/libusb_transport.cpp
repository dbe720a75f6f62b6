#include "libusb_transport.hpp"

#include <sys/time.h>

#include <utility>

#include "logging/logger.hpp"

namespace ippusb {
namespace usb {

namespace {
// Upper bound for the event thread to notice stop()
constexpr long kEventLoopTimeoutUsec = 100000;
}  // namespace

LibUsbTransport::~LibUsbTransport() {
    stop();

    if (ctx_) {
        libusb_exit(ctx_);
        ctx_ = nullptr;
    }
}

bool LibUsbTransport::init(std::string &error) {
    if (ctx_) {
        return true;
    }

    int rc = libusb_init(&ctx_);
    if (rc != LIBUSB_SUCCESS) {
        ctx_ = nullptr;
        error = std::string("libusb_init failed: ") + libusb_error_name(rc);
        return false;
    }

    LOG_DEBUG("[USB] libusb initialized");
    return true;
}

bool LibUsbTransport::start_hotplug(HotplugCallback on_hotplug, std::string &error) {
    if (!ctx_) {
        error = "libusb not initialized";
        return false;
    }
    if (running_.load()) {
        error = "Hotplug monitoring already running";
        return false;
    }

    if (!libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG)) {
        error = "libusb has no hotplug support on this platform";
        return false;
    }

    on_hotplug_ = std::move(on_hotplug);

    int rc = libusb_hotplug_register_callback(
        ctx_,
        static_cast<libusb_hotplug_event>(LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED | LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT),
        static_cast<libusb_hotplug_flag>(0), LIBUSB_HOTPLUG_MATCH_ANY, LIBUSB_HOTPLUG_MATCH_ANY,
        LIBUSB_HOTPLUG_MATCH_ANY, &LibUsbTransport::on_hotplug_event, this, &hotplug_handle_);
    if (rc != LIBUSB_SUCCESS) {
        error = std::string("libusb_hotplug_register_callback failed: ") + libusb_error_name(rc);
        return false;
    }
    hotplug_registered_ = true;

    running_.store(true);
    event_thread_ = std::thread([this]() { event_loop(); });

    LOG_INFO("[USB] Hotplug monitoring started");
    return true;
}

void LibUsbTransport::stop() {
    if (!ctx_) {
        return;
    }

    running_.store(false);

    // Deregistration also wakes up libusb_handle_events
    if (hotplug_registered_) {
        libusb_hotplug_deregister_callback(ctx_, hotplug_handle_);
        hotplug_registered_ = false;
    }

    if (event_thread_.joinable()) {
        event_thread_.join();
        LOG_DEBUG("[USB] Event thread stopped");
    }
}

void LibUsbTransport::event_loop() {
    while (running_.load()) {
        struct timeval tv = {0, kEventLoopTimeoutUsec};
        int rc = libusb_handle_events_timeout_completed(ctx_, &tv, nullptr);
        if (rc != LIBUSB_SUCCESS && rc != LIBUSB_ERROR_INTERRUPTED) {
            LOG_ERROR("[USB] libusb_handle_events failed: " << libusb_error_name(rc));
            break;
        }
    }
}

int LIBUSB_CALL LibUsbTransport::on_hotplug_event(libusb_context *, libusb_device *dev, libusb_hotplug_event event,
                                                  void *user_data) {
    auto *self = static_cast<LibUsbTransport *>(user_data);

    LOG_DEBUG("[USB] Hotplug: Bus " << static_cast<int>(libusb_get_bus_number(dev)) << " Device "
                                    << static_cast<int>(libusb_get_device_address(dev))
                                    << (event == LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED ? " arrived" : " left"));

    if (self->on_hotplug_) {
        self->on_hotplug_();
    }

    // Stay registered
    return 0;
}

bool LibUsbTransport::describe_device(libusb_device *dev, UsbDeviceDesc &desc) {
    libusb_device_descriptor dev_desc;
    if (libusb_get_device_descriptor(dev, &dev_desc) != LIBUSB_SUCCESS) {
        return false;
    }

    libusb_config_descriptor *conf = nullptr;
    int rc = libusb_get_active_config_descriptor(dev, &conf);
    if (rc != LIBUSB_SUCCESS) {
        // Unconfigured devices and devices we may not read are simply not ours
        LOG_DEBUG("[USB] Bus " << static_cast<int>(libusb_get_bus_number(dev)) << " Device "
                               << static_cast<int>(libusb_get_device_address(dev))
                               << ": no active configuration: " << libusb_error_name(rc));
        return false;
    }

    std::vector<UsbIppInterface> interfaces;

    for (uint8_t i = 0; i < conf->bNumInterfaces; ++i) {
        const libusb_interface &iface = conf->interface[i];

        for (int a = 0; a < iface.num_altsetting; ++a) {
            const libusb_interface_descriptor &alt = iface.altsetting[a];
            if (alt.bInterfaceClass != kIppUsbInterfaceClass || alt.bInterfaceSubClass != kIppUsbInterfaceSubClass ||
                alt.bInterfaceProtocol != kIppUsbInterfaceProtocol) {
                continue;
            }

            UsbIppInterface ipp;
            ipp.number = alt.bInterfaceNumber;
            ipp.alt_setting = alt.bAlternateSetting;

            for (uint8_t e = 0; e < alt.bNumEndpoints; ++e) {
                const libusb_endpoint_descriptor &ep = alt.endpoint[e];
                if ((ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) != LIBUSB_TRANSFER_TYPE_BULK) {
                    continue;
                }
                if ((ep.bEndpointAddress & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_IN) {
                    ipp.bulk_in = ep.bEndpointAddress;
                } else {
                    ipp.bulk_out = ep.bEndpointAddress;
                }
            }

            if (ipp.bulk_in != 0 && ipp.bulk_out != 0) {
                interfaces.push_back(ipp);
                break;  // One usable alternate setting per interface
            }
        }
    }

    uint8_t config_value = conf->bConfigurationValue;
    libusb_free_config_descriptor(conf);

    if (interfaces.size() < kMinIppUsbInterfaces) {
        return false;
    }

    desc.addr.bus = libusb_get_bus_number(dev);
    desc.addr.address = libusb_get_device_address(dev);
    desc.vendor_id = dev_desc.idVendor;
    desc.product_id = dev_desc.idProduct;
    desc.config = config_value;
    desc.interfaces = std::move(interfaces);
    return true;
}

bool LibUsbTransport::enumerate_devices(std::vector<UsbDeviceDesc> &descs, std::string &error) {
    if (!ctx_) {
        error = "libusb not initialized";
        return false;
    }

    libusb_device **list = nullptr;
    ssize_t count = libusb_get_device_list(ctx_, &list);
    if (count < 0) {
        error = std::string("libusb_get_device_list failed: ") + libusb_error_name(static_cast<int>(count));
        return false;
    }

    descs.clear();
    for (ssize_t i = 0; i < count; ++i) {
        UsbDeviceDesc desc;
        if (describe_device(list[i], desc)) {
            descs.push_back(std::move(desc));
        }
    }

    libusb_free_device_list(list, 1);
    return true;
}

libusb_device_handle *LibUsbTransport::open_device(const UsbAddr &addr, std::string &error) {
    if (!ctx_) {
        error = "libusb not initialized";
        return nullptr;
    }

    libusb_device **list = nullptr;
    ssize_t count = libusb_get_device_list(ctx_, &list);
    if (count < 0) {
        error = std::string("libusb_get_device_list failed: ") + libusb_error_name(static_cast<int>(count));
        return nullptr;
    }

    libusb_device_handle *handle = nullptr;
    bool found = false;

    for (ssize_t i = 0; i < count; ++i) {
        libusb_device *dev = list[i];
        if (libusb_get_bus_number(dev) != addr.bus || libusb_get_device_address(dev) != addr.address) {
            continue;
        }

        found = true;
        int rc = libusb_open(dev, &handle);
        if (rc != LIBUSB_SUCCESS) {
            handle = nullptr;
            error = std::string("libusb_open failed: ") + libusb_error_name(rc);
        }
        break;
    }

    libusb_free_device_list(list, 1);

    if (!found) {
        error = "device is gone";
    }
    return handle;
}

}  // namespace usb
}  // namespace ippusb

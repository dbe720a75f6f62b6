#include "runtime.hpp"

#include <chrono>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace ippusb {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing");

    transport_ = std::make_unique<usb::LibUsbTransport>();
    if (!transport_->init(error)) {
        return false;
    }

    factory_ = std::make_unique<device::UsbDeviceFactory>(*transport_, config_.network);

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::run(bool exit_when_idle, pnp::ExitReason &reason, std::string &error) {
    if (!transport_ || !factory_) {
        error = "Runtime not initialized";
        return false;
    }

    // Must be in place before the loop's first wait
    if (!SignalHandler::install(
            [this](int signal) {
                LOG_DEBUG("[Runtime] Caught " << SignalHandler::signal_name(signal));
                events_.post_terminate(SignalHandler::signal_name(signal));
            },
            error)) {
        return false;
    }

    // Registered before the first enumeration, so no arrival falls in between
    if (!transport_->start_hotplug([this]() { events_.post_hotplug(); }, error)) {
        SignalHandler::uninstall();
        return false;
    }

    pnp::FleetManager manager(*transport_, *factory_, events_,
                              std::chrono::milliseconds(config_.pnp.shutdown_grace_ms));
    reason = manager.run(exit_when_idle);

    LOG_INFO("[Runtime] Fleet manager exited: " << pnp::exit_reason_to_string(reason));

    shutdown();
    return true;
}

bool Runtime::check(std::vector<usb::UsbDeviceDesc> &descs, std::string &error) {
    if (!transport_) {
        error = "Runtime not initialized";
        return false;
    }

    return transport_->enumerate_devices(descs, error);
}

void Runtime::shutdown() {
    SignalHandler::uninstall();

    if (transport_) {
        transport_->stop();
    }
}

}  // namespace runtime
}  // namespace ippusb

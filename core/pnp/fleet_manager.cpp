#include "fleet_manager.hpp"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace ippusb {
namespace pnp {

const char *exit_reason_to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::IDLE:
            return "IDLE";
        case ExitReason::TERMINATED:
            return "TERMINATED";
        default:
            return "UNKNOWN";
    }
}

FleetManager::FleetManager(usb::IUsbTransport &transport, device::IDeviceFactory &factory, IEventSource &events,
                           std::chrono::milliseconds shutdown_grace)
    : transport_(transport), factory_(factory), events_(events), shutdown_grace_(shutdown_grace) {}

ExitReason FleetManager::run(bool exit_when_idle) {
    FleetState state;

    LOG_INFO("[PnP] Started" << (exit_when_idle ? " (exit when idle)" : ""));

    while (true) {
        reconcile(state);

        if (exit_when_idle && state.known.empty()) {
            LOG_INFO("[PnP] No IPP-over-USB devices present, exiting");
            return ExitReason::IDLE;
        }

        PnpEvent event = events_.wait();
        if (event.kind == PnpEvent::Kind::TERMINATE) {
            LOG_INFO("[PnP] " << event.reason << " received, exiting");
            break;
        }

        LOG_DEBUG("[PnP] Hotplug event, rescanning");
    }

    ShutdownCoordinator coordinator(shutdown_grace_);
    coordinator.shutdown_all(state.registry);

    return ExitReason::TERMINATED;
}

bool FleetManager::reconcile(FleetState &state) {
    std::vector<usb::UsbDeviceDesc> descs;
    std::string error;

    // A failed enumeration says nothing about presence; keep the fleet as is
    if (!transport_.enumerate_devices(descs, error)) {
        LOG_WARN("[PnP] Device enumeration failed: " << error);
        return false;
    }

    AddressSet current;
    std::unordered_map<usb::UsbAddr, usb::UsbDeviceDesc> desc_by_addr;
    for (auto &desc : descs) {
        current.insert(desc.addr);
        desc_by_addr.emplace(desc.addr, std::move(desc));
    }

    AddressDiff diff = diff_addresses(state.known, current);
    state.known = std::move(current);

    for (const auto &addr : diff.added) {
        std::string create_error;
        auto dev = factory_.create(desc_by_addr.at(addr), create_error);
        if (!dev) {
            LOG_ERROR("[PnP] " << addr.to_string() << ": " << create_error);
            // Forget it, so the next enumeration reports it as added again
            state.known.erase(addr);
            continue;
        }

        if (!state.registry.add(addr, std::move(dev))) {
            LOG_ERROR("[PnP] " << addr.to_string() << ": already registered");
            dev->close();
            continue;
        }

        LOG_DEBUG("[PnP] " << addr.to_string() << ": added");
    }

    for (const auto &addr : diff.removed) {
        LOG_DEBUG("[PnP] " << addr.to_string() << ": removed");

        auto dev = state.registry.remove(addr);
        if (dev) {
            dev->close();
        }
    }

    return true;
}

}  // namespace pnp
}  // namespace ippusb

#pragma once

#include <chrono>

#include "address_diff.hpp"
#include "device/i_device.hpp"
#include "device_registry.hpp"
#include "event_queue.hpp"
#include "shutdown_coordinator.hpp"
#include "usb/i_usb_transport.hpp"

namespace ippusb {
namespace pnp {

enum class ExitReason {
    IDLE,       // No more devices to serve and exit_when_idle was requested
    TERMINATED  // Termination event received, fleet shut down
};

const char *exit_reason_to_string(ExitReason reason);

// Fleet state of one run() invocation. Invariant between cycles:
// known == set of addresses registered in registry.
struct FleetState {
    AddressSet known;
    DeviceRegistry registry;
};

// FleetManager is the PnP manager: it keeps one device instance per attached
// IPP-over-USB device, reconciling against a fresh enumeration every time the
// event source reports a hotplug, and drains the fleet on termination.
class FleetManager {
public:
    FleetManager(usb::IUsbTransport &transport, device::IDeviceFactory &factory, IEventSource &events,
                 std::chrono::milliseconds shutdown_grace = kDefaultShutdownGrace);

    // Blocks until the fleet is idle (only if exit_when_idle) or a termination
    // event arrives. On termination every device is shut down before returning.
    ExitReason run(bool exit_when_idle);

    // One enumerate -> diff -> apply pass over state.
    // Returns false if enumeration failed (state is left untouched).
    bool reconcile(FleetState &state);

private:
    usb::IUsbTransport &transport_;
    device::IDeviceFactory &factory_;
    IEventSource &events_;
    std::chrono::milliseconds shutdown_grace_;
};

}  // namespace pnp
}  // namespace ippusb

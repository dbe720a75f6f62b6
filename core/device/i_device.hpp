#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "usb/usb_types.hpp"

namespace ippusb {
namespace device {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

// Created -> Active -> ShuttingDown -> Closed
enum class DeviceState { CREATED, ACTIVE, SHUTTING_DOWN, CLOSED };

inline const char *device_state_to_string(DeviceState state) {
    switch (state) {
        case DeviceState::CREATED:
            return "CREATED";
        case DeviceState::ACTIVE:
            return "ACTIVE";
        case DeviceState::SHUTTING_DOWN:
            return "SHUTTING_DOWN";
        case DeviceState::CLOSED:
            return "CLOSED";
        default:
            return "UNKNOWN";
    }
}

// One running per-device bridge instance (HTTP listener <-> USB interfaces).
// Interface to enable mocking in the PnP tests.
class IDevice {
public:
    virtual ~IDevice() = default;

    virtual const usb::UsbAddr &addr() const = 0;

    // Graceful stop. Must return at or before the deadline even if the
    // underlying work did not complete.
    virtual void shutdown(Deadline deadline) = 0;

    // Release every resource. Idempotent, safe after a partial shutdown().
    virtual void close() = 0;
};

class IDeviceFactory {
public:
    virtual ~IDeviceFactory() = default;

    // Returns nullptr and sets error if the device cannot be brought up
    // (e.g. interface busy, no free HTTP port)
    virtual std::unique_ptr<IDevice> create(const usb::UsbDeviceDesc &desc, std::string &error) = 0;
};

}  // namespace device
}  // namespace ippusb

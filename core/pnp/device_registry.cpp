#include "device_registry.hpp"

#include <utility>

namespace ippusb {
namespace pnp {

bool DeviceRegistry::add(const usb::UsbAddr &addr, std::unique_ptr<device::IDevice> &&device) {
    if (!device || contains(addr)) {
        return false;
    }
    devices_.emplace(addr, std::move(device));
    return true;
}

std::unique_ptr<device::IDevice> DeviceRegistry::remove(const usb::UsbAddr &addr) {
    auto it = devices_.find(addr);
    if (it == devices_.end()) {
        return nullptr;
    }

    auto device = std::move(it->second);
    devices_.erase(it);
    return device;
}

bool DeviceRegistry::contains(const usb::UsbAddr &addr) const { return devices_.find(addr) != devices_.end(); }

device::IDevice *DeviceRegistry::find(const usb::UsbAddr &addr) const {
    auto it = devices_.find(addr);
    if (it == devices_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<usb::UsbAddr> DeviceRegistry::addresses() const {
    std::vector<usb::UsbAddr> result;
    result.reserve(devices_.size());

    for (const auto &[addr, device] : devices_) {
        result.push_back(addr);
    }

    return result;
}

std::vector<std::unique_ptr<device::IDevice>> DeviceRegistry::release_all() {
    std::vector<std::unique_ptr<device::IDevice>> result;
    result.reserve(devices_.size());

    for (auto &[addr, device] : devices_) {
        result.push_back(std::move(device));
    }
    devices_.clear();

    return result;
}

}  // namespace pnp
}  // namespace ippusb

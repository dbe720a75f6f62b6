#pragma once

#include <memory>
#include <unordered_map>
#include <vector>

#include "device/i_device.hpp"
#include "usb/usb_types.hpp"

namespace ippusb {
namespace pnp {

/**
 * @brief Mapping from USB address to the live device serving it
 *
 * The registry is the sole owner of every device it holds. A device leaves the
 * registry either through remove() (device unplugged) or release_all()
 * (terminal shutdown), in both cases by transferring the unique_ptr out.
 *
 * Thread Safety:
 * - None. The registry belongs to one FleetManager::run() invocation and is only
 *   touched from the thread running it. During shutdown ownership moves to
 *   the shutdown coordinator via release_all().
 */
class DeviceRegistry {
public:
    DeviceRegistry() = default;

    DeviceRegistry(const DeviceRegistry &) = delete;
    DeviceRegistry &operator=(const DeviceRegistry &) = delete;
    DeviceRegistry(DeviceRegistry &&) = default;
    DeviceRegistry &operator=(DeviceRegistry &&) = default;

    /**
     * @brief Register a device under its address
     *
     * The device is only moved from on success.
     *
     * @return false (and leaves both the registry and device untouched) if the
     *         address is already registered or the device is null
     */
    bool add(const usb::UsbAddr &addr, std::unique_ptr<device::IDevice> &&device);

    /**
     * @brief Detach a device from the registry
     *
     * @return The device, or nullptr if the address is not registered
     */
    std::unique_ptr<device::IDevice> remove(const usb::UsbAddr &addr);

    bool contains(const usb::UsbAddr &addr) const;

    // Non-owning lookup; nullptr if absent
    device::IDevice *find(const usb::UsbAddr &addr) const;

    std::vector<usb::UsbAddr> addresses() const;

    size_t size() const { return devices_.size(); }
    bool empty() const { return devices_.empty(); }

    /**
     * @brief Move every device out, leaving the registry empty
     *
     * Used by the shutdown coordinator to take exclusive ownership of the fleet.
     */
    std::vector<std::unique_ptr<device::IDevice>> release_all();

private:
    std::unordered_map<usb::UsbAddr, std::unique_ptr<device::IDevice>> devices_;
};

}  // namespace pnp
}  // namespace ippusb

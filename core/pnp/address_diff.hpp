#pragma once

#include <unordered_set>
#include <vector>

#include "usb/usb_types.hpp"

namespace ippusb {
namespace pnp {

using AddressSet = std::unordered_set<usb::UsbAddr>;

struct AddressDiff {
    std::vector<usb::UsbAddr> added;    // In the new set only
    std::vector<usb::UsbAddr> removed;  // In the previous set only

    bool empty() const { return added.empty() && removed.empty(); }
};

// Compute added/removed addresses between two sets. Order within the result
// vectors is unspecified. Linear in |previous| + |current|.
AddressDiff diff_addresses(const AddressSet &previous, const AddressSet &current);

}  // namespace pnp
}  // namespace ippusb

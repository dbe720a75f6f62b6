#include "address_diff.hpp"

namespace ippusb {
namespace pnp {

AddressDiff diff_addresses(const AddressSet &previous, const AddressSet &current) {
    AddressDiff diff;

    for (const auto &addr : current) {
        if (previous.find(addr) == previous.end()) {
            diff.added.push_back(addr);
        }
    }

    for (const auto &addr : previous) {
        if (current.find(addr) == current.end()) {
            diff.removed.push_back(addr);
        }
    }

    return diff;
}

}  // namespace pnp
}  // namespace ippusb

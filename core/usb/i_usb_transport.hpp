#pragma once

#include <string>
#include <vector>

#include "usb_types.hpp"

namespace ippusb {
namespace usb {

// Hardware collaborator of the PnP manager. Interface so the reconciliation
// loop can be driven by scripted enumerations in tests.
class IUsbTransport {
public:
    virtual ~IUsbTransport() = default;

    // Current IPP-over-USB capable devices.
    // Returns false (and sets error) on a transient failure. A successful call
    // with an empty result means nothing is attached.
    virtual bool enumerate_devices(std::vector<UsbDeviceDesc> &descs, std::string &error) = 0;
};

}  // namespace usb
}  // namespace ippusb

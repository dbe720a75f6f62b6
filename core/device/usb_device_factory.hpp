#pragma once

#include <memory>
#include <string>

#include "i_device.hpp"
#include "runtime/config.hpp"
#include "usb/libusb_transport.hpp"

namespace ippusb {
namespace device {

// Creates UsbDevice bridges for devices found by a LibUsbTransport
class UsbDeviceFactory : public IDeviceFactory {
public:
    UsbDeviceFactory(usb::LibUsbTransport &transport, const runtime::NetworkConfig &network);

    std::unique_ptr<IDevice> create(const usb::UsbDeviceDesc &desc, std::string &error) override;

private:
    usb::LibUsbTransport &transport_;
    runtime::NetworkConfig network_;
};

}  // namespace device
}  // namespace ippusb

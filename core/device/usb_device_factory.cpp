#include "usb_device_factory.hpp"

#include "usb_device.hpp"

namespace ippusb {
namespace device {

UsbDeviceFactory::UsbDeviceFactory(usb::LibUsbTransport &transport, const runtime::NetworkConfig &network)
    : transport_(transport), network_(network) {}

std::unique_ptr<IDevice> UsbDeviceFactory::create(const usb::UsbDeviceDesc &desc, std::string &error) {
    libusb_device_handle *handle = transport_.open_device(desc.addr, error);
    if (!handle) {
        return nullptr;
    }

    return UsbDevice::open(handle, desc, network_, error);
}

}  // namespace device
}  // namespace ippusb

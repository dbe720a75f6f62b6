#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ippusb {
namespace usb {

// Attachment point of a device: bus number plus the address the bus assigned to it.
// A re-plugged device gets a new address, so it never compares equal to its old self.
struct UsbAddr {
    uint8_t bus = 0;
    uint8_t address = 0;

    std::string to_string() const;  // "Bus 001 Device 004"

    bool operator==(const UsbAddr &other) const { return bus == other.bus && address == other.address; }
    bool operator!=(const UsbAddr &other) const { return !(*this == other); }
    bool operator<(const UsbAddr &other) const {
        return bus != other.bus ? bus < other.bus : address < other.address;
    }
};

// USB interface class/subclass/protocol triple of an IPP-over-USB interface
constexpr uint8_t kIppUsbInterfaceClass = 7;
constexpr uint8_t kIppUsbInterfaceSubClass = 1;
constexpr uint8_t kIppUsbInterfaceProtocol = 4;

// ipp-usb needs two interfaces to multiplex concurrent HTTP requests
constexpr size_t kMinIppUsbInterfaces = 2;

// Vendor/product id as 4 lowercase hex digits, e.g. "04a9"
std::string format_usb_id(uint16_t id);

struct UsbIppInterface {
    uint8_t number = 0;
    uint8_t alt_setting = 0;
    uint8_t bulk_in = 0;   // Endpoint address, direction bit set
    uint8_t bulk_out = 0;  // Endpoint address
};

// Enumeration record for one IPP-over-USB capable device.
// Only valid for the reconciliation cycle that produced it.
struct UsbDeviceDesc {
    UsbAddr addr;
    uint16_t vendor_id = 0;
    uint16_t product_id = 0;
    uint8_t config = 0;  // bConfigurationValue of the active configuration
    std::vector<UsbIppInterface> interfaces;
};

}  // namespace usb
}  // namespace ippusb

namespace std {
template <>
struct hash<ippusb::usb::UsbAddr> {
    size_t operator()(const ippusb::usb::UsbAddr &addr) const noexcept {
        return std::hash<uint16_t>()(static_cast<uint16_t>((addr.bus << 8) | addr.address));
    }
};
}  // namespace std

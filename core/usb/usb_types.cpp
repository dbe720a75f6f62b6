#include "usb_types.hpp"

#include <iomanip>
#include <sstream>

namespace ippusb {
namespace usb {

std::string UsbAddr::to_string() const {
    std::ostringstream os;
    os << "Bus " << std::setfill('0') << std::setw(3) << static_cast<int>(bus) << " Device " << std::setw(3)
       << static_cast<int>(address);
    return os.str();
}

std::string format_usb_id(uint16_t id) {
    std::ostringstream os;
    os << std::hex << std::setfill('0') << std::setw(4) << id;
    return os.str();
}

}  // namespace usb
}  // namespace ippusb

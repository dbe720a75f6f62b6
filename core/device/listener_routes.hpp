#pragma once

#include <string>

namespace ippusb {
namespace device {

// What a device listener does with a request
enum class ListenerRoute {
    STATUS,      // GET/HEAD /ippusb/status
    UNAVAILABLE  // Anything else; would be forwarded to the printer
};

constexpr const char *kStatusPath = "/ippusb/status";

ListenerRoute classify_request(const std::string &method, const std::string &path);

// 200 for STATUS, 503 for UNAVAILABLE
int route_http_status(ListenerRoute route);

const char *listener_route_to_string(ListenerRoute route);

}  // namespace device
}  // namespace ippusb

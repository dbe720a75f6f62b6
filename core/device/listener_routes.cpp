#include "listener_routes.hpp"

namespace ippusb {
namespace device {

ListenerRoute classify_request(const std::string &method, const std::string &path) {
    // httplib serves HEAD through the GET handlers
    if ((method == "GET" || method == "HEAD") && path == kStatusPath) {
        return ListenerRoute::STATUS;
    }
    return ListenerRoute::UNAVAILABLE;
}

int route_http_status(ListenerRoute route) {
    switch (route) {
        case ListenerRoute::STATUS:
            return 200;
        case ListenerRoute::UNAVAILABLE:
            return 503;
        default:
            return 500;
    }
}

const char *listener_route_to_string(ListenerRoute route) {
    switch (route) {
        case ListenerRoute::STATUS:
            return "STATUS";
        case ListenerRoute::UNAVAILABLE:
            return "UNAVAILABLE";
        default:
            return "UNKNOWN";
    }
}

}  // namespace device
}  // namespace ippusb

#include "device/listener_routes.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace ippusb::device;

namespace {
// Methods the device listener registers a catch-all route for
const std::vector<std::string> kMethods = {"GET", "HEAD", "POST", "PUT", "DELETE", "PATCH", "OPTIONS"};
}  // namespace

TEST(ListenerRoutesTest, StatusPathServedForGetAndHead) {
    EXPECT_EQ(classify_request("GET", "/ippusb/status"), ListenerRoute::STATUS);
    EXPECT_EQ(classify_request("HEAD", "/ippusb/status"), ListenerRoute::STATUS);
    EXPECT_EQ(route_http_status(ListenerRoute::STATUS), 200);
}

TEST(ListenerRoutesTest, EveryMethodOnPrinterPathIsUnavailable) {
    for (const auto &method : kMethods) {
        for (const std::string path : {"/ipp/print", "/eSCL/ScanJobs/1", "/"}) {
            ListenerRoute route = classify_request(method, path);
            EXPECT_EQ(route, ListenerRoute::UNAVAILABLE) << method << " " << path;
            EXPECT_EQ(route_http_status(route), 503) << method << " " << path;
        }
    }
}

TEST(ListenerRoutesTest, NonReadMethodsOnStatusPathAreUnavailable) {
    for (const std::string method : {"POST", "PUT", "DELETE", "PATCH", "OPTIONS"}) {
        EXPECT_EQ(classify_request(method, "/ippusb/status"), ListenerRoute::UNAVAILABLE) << method;
    }
}

TEST(ListenerRoutesTest, StatusPathMatchIsExact) {
    EXPECT_EQ(classify_request("GET", "/ippusb/status/extra"), ListenerRoute::UNAVAILABLE);
    EXPECT_EQ(classify_request("GET", "/ippusb"), ListenerRoute::UNAVAILABLE);
}

TEST(ListenerRoutesTest, ToString) {
    EXPECT_STREQ(listener_route_to_string(ListenerRoute::STATUS), "STATUS");
    EXPECT_STREQ(listener_route_to_string(ListenerRoute::UNAVAILABLE), "UNAVAILABLE");
}

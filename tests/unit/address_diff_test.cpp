#include "pnp/address_diff.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <initializer_list>

#include "mocks/mock_device.hpp"

using namespace ippusb;
using namespace testing;
using namespace ippusb::tests;

namespace {
pnp::AddressSet make_set(std::initializer_list<usb::UsbAddr> addrs) { return pnp::AddressSet(addrs); }
}  // namespace

TEST(AddressDiffTest, BothEmpty) {
    auto diff = pnp::diff_addresses({}, {});
    EXPECT_TRUE(diff.empty());
}

TEST(AddressDiffTest, EmptyPreviousAddsEverything) {
    auto current = make_set({make_addr(1, 4), make_addr(1, 5), make_addr(2, 3)});

    auto diff = pnp::diff_addresses({}, current);

    EXPECT_THAT(diff.added, UnorderedElementsAre(make_addr(1, 4), make_addr(1, 5), make_addr(2, 3)));
    EXPECT_TRUE(diff.removed.empty());
}

TEST(AddressDiffTest, EmptyCurrentRemovesEverything) {
    auto previous = make_set({make_addr(1, 4), make_addr(2, 3)});

    auto diff = pnp::diff_addresses(previous, {});

    EXPECT_TRUE(diff.added.empty());
    EXPECT_THAT(diff.removed, UnorderedElementsAre(make_addr(1, 4), make_addr(2, 3)));
}

TEST(AddressDiffTest, SameSetIsNoChange) {
    auto set = make_set({make_addr(1, 4), make_addr(1, 7)});

    auto diff = pnp::diff_addresses(set, set);

    EXPECT_TRUE(diff.added.empty());
    EXPECT_TRUE(diff.removed.empty());
    EXPECT_TRUE(diff.empty());
}

TEST(AddressDiffTest, OverlappingSets) {
    auto previous = make_set({make_addr(1, 4), make_addr(1, 5)});
    auto current = make_set({make_addr(1, 5), make_addr(1, 6)});

    auto diff = pnp::diff_addresses(previous, current);

    EXPECT_THAT(diff.added, ElementsAre(make_addr(1, 6)));
    EXPECT_THAT(diff.removed, ElementsAre(make_addr(1, 4)));
}

TEST(AddressDiffTest, ReplugYieldsRemoveAndAdd) {
    // Same bus, new device address after re-enumeration
    auto diff = pnp::diff_addresses(make_set({make_addr(3, 9)}), make_set({make_addr(3, 10)}));

    EXPECT_THAT(diff.added, ElementsAre(make_addr(3, 10)));
    EXPECT_THAT(diff.removed, ElementsAre(make_addr(3, 9)));
}

TEST(AddressDiffTest, SameAddressOnDifferentBusesIsDistinct) {
    auto diff = pnp::diff_addresses(make_set({make_addr(1, 4)}), make_set({make_addr(2, 4)}));

    EXPECT_THAT(diff.added, ElementsAre(make_addr(2, 4)));
    EXPECT_THAT(diff.removed, ElementsAre(make_addr(1, 4)));
}

TEST(AddressDiffTest, AddedAndRemovedAreDisjoint) {
    auto previous = make_set({make_addr(1, 1), make_addr(1, 2), make_addr(1, 3), make_addr(2, 1)});
    auto current = make_set({make_addr(1, 2), make_addr(1, 3), make_addr(2, 2), make_addr(2, 3)});

    auto diff = pnp::diff_addresses(previous, current);

    for (const auto &addr : diff.added) {
        EXPECT_EQ(previous.count(addr), 0u) << addr.to_string();
        EXPECT_EQ(current.count(addr), 1u) << addr.to_string();
        EXPECT_THAT(diff.removed, Not(Contains(addr)));
    }
    for (const auto &addr : diff.removed) {
        EXPECT_EQ(previous.count(addr), 1u) << addr.to_string();
        EXPECT_EQ(current.count(addr), 0u) << addr.to_string();
    }
    EXPECT_EQ(diff.added.size(), 2u);
    EXPECT_EQ(diff.removed.size(), 2u);
}

TEST(UsbAddrTest, Formatting) {
    EXPECT_EQ(make_addr(1, 4).to_string(), "Bus 001 Device 004");
    EXPECT_EQ(make_addr(12, 127).to_string(), "Bus 012 Device 127");
    EXPECT_EQ(usb::format_usb_id(0x04a9), "04a9");
}

TEST(UsbAddrTest, Ordering) {
    EXPECT_LT(make_addr(1, 9), make_addr(2, 1));
    EXPECT_LT(make_addr(1, 3), make_addr(1, 4));
    EXPECT_FALSE(make_addr(1, 4) < make_addr(1, 4));
    EXPECT_NE(make_addr(1, 4), make_addr(1, 5));
}

/**
 * @file test_network_range.cpp
 * @brief Тесты для CIDR диапазонов
 */

#include <gtest/gtest.h>

#include "discovery/network_range.hpp"

#include <format>
#include <set>

namespace axectl::tests {

using discovery::NetworkRange;

// =============================================================================
// Разбор
// =============================================================================

TEST(NetworkRangeTest, ParseSlash24) {
    auto range = NetworkRange::parse("192.168.1.0/24");
    ASSERT_TRUE(range.has_value());

    EXPECT_EQ(range->family(), NetworkRange::Family::V4);
    EXPECT_EQ(range->prefix_length(), 24);
    EXPECT_EQ(range->to_string(), "192.168.1.0/24");
    EXPECT_EQ(range->first_host(), "192.168.1.0");
    EXPECT_EQ(range->last_host(), "192.168.1.255");
    EXPECT_TRUE(range->is_private());
}

/** @brief Тест: биты хоста сбрасываются */
TEST(NetworkRangeTest, ParseMasksHostBits) {
    auto range = NetworkRange::parse("10.1.2.77/24");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->to_string(), "10.1.2.0/24");
}

TEST(NetworkRangeTest, BareAddressIsSingleHost) {
    auto range = NetworkRange::parse("192.168.1.42");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->prefix_length(), 32);

    auto addresses = range->addresses();
    ASSERT_EQ(addresses.size(), 1u);
    EXPECT_EQ(addresses[0], "192.168.1.42");
}

TEST(NetworkRangeTest, RejectsMalformed) {
    for (const char* text : {"", "not-an-ip", "192.168.1.0/33", "192.168.1.0/", "300.1.1.1/24",
                             "192.168.1/24", "192.168.1.0/abc", "fe80::/129"}) {
        auto range = NetworkRange::parse(text);
        ASSERT_FALSE(range.has_value()) << text;
        EXPECT_EQ(range.error().code, ErrorCode::DiscoveryInvalidRange) << text;
    }
}

/** @brief Тест: повторный разбор to_string() даёт тот же диапазон */
TEST(NetworkRangeTest, ToStringRoundTrips) {
    for (const char* text : {"10.0.0.0/8", "172.16.0.0/12", "192.168.100.0/24", "8.8.8.8/32", "fd00::/64"}) {
        auto range = NetworkRange::parse(text);
        ASSERT_TRUE(range.has_value()) << text;

        auto again = NetworkRange::parse(range->to_string());
        ASSERT_TRUE(again.has_value()) << text;
        EXPECT_EQ(*range, *again) << text;
    }
}

// =============================================================================
// Перечисление адресов
// =============================================================================

/** @brief Тест: мощность addresses() соответствует длине префикса */
TEST(NetworkRangeTest, AddressCardinalityMatchesPrefix) {
    for (int prefix = 20; prefix <= 32; ++prefix) {
        auto range = NetworkRange::parse(std::format("10.20.0.0/{}", prefix));
        ASSERT_TRUE(range.has_value()) << prefix;

        auto expected = std::size_t{1} << (32 - prefix);
        auto addresses = range->addresses();
        EXPECT_EQ(addresses.size(), expected) << prefix;
        EXPECT_EQ(range->host_count(), expected) << prefix;

        std::set<std::string> unique(addresses.begin(), addresses.end());
        EXPECT_EQ(unique.size(), addresses.size()) << prefix;
    }
}

TEST(NetworkRangeTest, AddressesAscending) {
    auto range = NetworkRange::parse("192.168.1.252/30");
    ASSERT_TRUE(range.has_value());

    auto addresses = range->addresses();
    ASSERT_EQ(addresses.size(), 4u);
    EXPECT_EQ(addresses[0], "192.168.1.252");
    EXPECT_EQ(addresses[1], "192.168.1.253");
    EXPECT_EQ(addresses[2], "192.168.1.254");
    EXPECT_EQ(addresses[3], "192.168.1.255");
}

TEST(NetworkRangeTest, Ipv6EnumerationIsCapped) {
    auto range = NetworkRange::parse("fd00::/64");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->family(), NetworkRange::Family::V6);
    EXPECT_EQ(range->addresses().size(), 1000u);
}

TEST(NetworkRangeTest, EstimatedScanTime) {
    auto range = NetworkRange::parse("192.168.1.0/24");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->estimated_scan_seconds(1000), 256u);
}

// =============================================================================
// Классификация адресов
// =============================================================================

TEST(AddressTest, PrivateClassification) {
    EXPECT_TRUE(discovery::is_private_address("10.1.2.3"));
    EXPECT_TRUE(discovery::is_private_address("172.16.0.1"));
    EXPECT_TRUE(discovery::is_private_address("172.31.255.255"));
    EXPECT_TRUE(discovery::is_private_address("192.168.0.10"));
    EXPECT_FALSE(discovery::is_private_address("172.32.0.1"));
    EXPECT_FALSE(discovery::is_private_address("8.8.8.8"));
}

TEST(AddressTest, Validity) {
    EXPECT_TRUE(discovery::is_valid_address("192.168.1.1"));
    EXPECT_TRUE(discovery::is_valid_address("::1"));
    EXPECT_FALSE(discovery::is_valid_address("bitaxe.local"));
    EXPECT_FALSE(discovery::is_valid_address("192.168.1.256"));
}

TEST(NetworkRangeTest, FromLocalAddress) {
    auto range = NetworkRange::from_local_address("192.168.7.42");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->to_string(), "192.168.7.0/24");

    auto v6 = NetworkRange::from_local_address("fe80::1");
    ASSERT_FALSE(v6.has_value());
    EXPECT_EQ(v6.error().code, ErrorCode::DiscoveryIpv6Unsupported);

    auto bad = NetworkRange::from_local_address("nope");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::DiscoveryInvalidAddress);
}

TEST(NetworkRangeTest, FallbackNetworks) {
    auto networks = NetworkRange::fallback_networks();
    ASSERT_EQ(networks.size(), 5u);
    EXPECT_EQ(networks[0].to_string(), "192.168.1.0/24");
    for (const auto& network : networks) {
        EXPECT_TRUE(network.is_private());
    }
}

} // namespace axectl::tests

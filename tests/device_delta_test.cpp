#include "gtest/gtest.h"
#include "netpilot/device_delta.hpp"

#include <algorithm>
#include <cstdio>
#include <random>
#include <set>
#include <string>
#include <vector>

using netpilot::DeviceDelta;
using netpilot::DeviceRef;
using netpilot::compute_device_delta;

namespace {

std::string mac_for(int n) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "aa:bb:cc:dd:%02x:%02x", (n >> 8) & 0xff, n & 0xff);
    return buf;
}

std::string ip_for(int n) {
    return "10.0." + std::to_string(n / 250) + "." + std::to_string(n % 250 + 1);
}

// Draws `count` devices with distinct MACs and distinct IPs from small pools
// so that stored and incoming lists overlap on either key.
std::vector<DeviceRef> draw_devices(std::mt19937& rng, int count) {
    std::uniform_int_distribution<int> pick(0, 11);
    std::set<int> macs;
    std::set<int> ips;
    std::vector<DeviceRef> devices;
    while (static_cast<int>(devices.size()) < count) {
        int m = pick(rng);
        int i = pick(rng);
        if (macs.count(m) || ips.count(i)) continue;
        macs.insert(m);
        ips.insert(i);
        devices.push_back({ip_for(i), mac_for(m)});
    }
    return devices;
}

} // namespace

TEST(DeviceDeltaTest, SameMacNewIpIsIpChange) {
    std::vector<DeviceRef> stored = {{"10.0.0.9", "aa:bb:cc:dd:ee:02"}};
    std::vector<DeviceRef> incoming = {{"10.0.0.10", "aa:bb:cc:dd:ee:02"}};
    DeviceDelta delta = compute_device_delta(stored, incoming);

    ASSERT_EQ(delta.ip_changed.size(), 1u);
    EXPECT_EQ(delta.ip_changed[0].first, stored[0]);
    EXPECT_EQ(delta.ip_changed[0].second, incoming[0]);
    EXPECT_TRUE(delta.added.empty());
    EXPECT_TRUE(delta.removed.empty());
    EXPECT_TRUE(delta.mac_changed.empty());
    EXPECT_TRUE(delta.unchanged.empty());
}

TEST(DeviceDeltaTest, SameIpNewMacIsMacChange) {
    std::vector<DeviceRef> stored = {{"10.0.0.9", "aa:bb:cc:dd:ee:02"}};
    std::vector<DeviceRef> incoming = {{"10.0.0.9", "aa:bb:cc:dd:ee:03"}};
    DeviceDelta delta = compute_device_delta(stored, incoming);
    ASSERT_EQ(delta.mac_changed.size(), 1u);
    EXPECT_EQ(delta.mac_changed[0].second.mac, "aa:bb:cc:dd:ee:03");
    EXPECT_TRUE(delta.has_changes());
}

TEST(DeviceDeltaTest, AddedRemovedAndUnchanged) {
    std::vector<DeviceRef> stored = {{"10.0.0.1", "aa:bb:cc:dd:ee:01"}, {"10.0.0.2", "aa:bb:cc:dd:ee:02"}};
    std::vector<DeviceRef> incoming = {{"10.0.0.1", "AA:BB:CC:DD:EE:01"}, {"10.0.0.3", "aa:bb:cc:dd:ee:03"}};
    DeviceDelta delta = compute_device_delta(stored, incoming);

    ASSERT_EQ(delta.unchanged.size(), 1u);
    EXPECT_EQ(delta.unchanged[0].ip, "10.0.0.1");
    ASSERT_EQ(delta.added.size(), 1u);
    EXPECT_EQ(delta.added[0].ip, "10.0.0.3");
    ASSERT_EQ(delta.removed.size(), 1u);
    EXPECT_EQ(delta.removed[0].ip, "10.0.0.2");
}

TEST(DeviceDeltaTest, IdenticalListsHaveNoChanges) {
    std::vector<DeviceRef> devices = {{"10.0.0.1", "aa:bb:cc:dd:ee:01"}};
    EXPECT_FALSE(compute_device_delta(devices, devices).has_changes());
    EXPECT_FALSE(compute_device_delta({}, {}).has_changes());
}

TEST(DeviceDeltaTest, CrossedKeysPairEachStoredDeviceOnce) {
    // Incoming #1 takes stored A by MAC; incoming #2 shares A's IP but A is
    // already paired, so it is added rather than double counted.
    std::vector<DeviceRef> stored = {{"10.0.0.1", "aa:bb:cc:dd:ee:01"}};
    std::vector<DeviceRef> incoming = {{"10.0.0.7", "aa:bb:cc:dd:ee:01"}, {"10.0.0.1", "aa:bb:cc:dd:ee:09"}};
    DeviceDelta delta = compute_device_delta(stored, incoming);
    EXPECT_EQ(delta.ip_changed.size(), 1u);
    EXPECT_EQ(delta.added.size(), 1u);
    EXPECT_TRUE(delta.removed.empty());
    EXPECT_TRUE(delta.mac_changed.empty());
}

TEST(DeviceDeltaTest, MacMatchWinsRegardlessOfIncomingOrder) {
    // The device sharing the stored IP comes first; the stored device must
    // still pair with the one carrying its MAC.
    std::vector<DeviceRef> stored = {{"10.0.0.1", "aa:bb:cc:dd:ee:01"}};
    std::vector<DeviceRef> incoming = {{"10.0.0.1", "aa:bb:cc:dd:ee:99"}, {"10.0.0.2", "AA-BB-CC-DD-EE-01"}};

    for (int pass = 0; pass < 2; ++pass) {
        DeviceDelta delta = compute_device_delta(stored, incoming);
        ASSERT_EQ(delta.ip_changed.size(), 1u) << "pass " << pass;
        EXPECT_EQ(delta.ip_changed[0].second.ip, "10.0.0.2");
        EXPECT_TRUE(delta.mac_changed.empty());
        ASSERT_EQ(delta.added.size(), 1u);
        EXPECT_EQ(delta.added[0].mac, "aa:bb:cc:dd:ee:99");
        EXPECT_TRUE(delta.removed.empty());
        std::reverse(incoming.begin(), incoming.end());
    }
}

TEST(DeviceDeltaTest, EveryDeviceLandsInExactlyOneBucket) {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> size(0, 6);
    for (int round = 0; round < 300; ++round) {
        std::vector<DeviceRef> stored = draw_devices(rng, size(rng));
        std::vector<DeviceRef> incoming = draw_devices(rng, size(rng));
        DeviceDelta delta = compute_device_delta(stored, incoming);

        const size_t changed = delta.ip_changed.size() + delta.mac_changed.size();
        EXPECT_EQ(delta.added.size() + changed + delta.unchanged.size(), incoming.size()) << "round " << round;
        EXPECT_EQ(delta.removed.size() + changed + delta.unchanged.size(), stored.size()) << "round " << round;

        std::multiset<DeviceRef> incoming_seen(delta.added.begin(), delta.added.end());
        incoming_seen.insert(delta.unchanged.begin(), delta.unchanged.end());
        std::multiset<DeviceRef> stored_seen(delta.removed.begin(), delta.removed.end());
        for (const auto& pair : delta.ip_changed) {
            stored_seen.insert(pair.first);
            incoming_seen.insert(pair.second);
        }
        for (const auto& pair : delta.mac_changed) {
            stored_seen.insert(pair.first);
            incoming_seen.insert(pair.second);
        }
        EXPECT_EQ(incoming_seen, std::multiset<DeviceRef>(incoming.begin(), incoming.end())) << "round " << round;
        for (const auto& d : delta.unchanged) {
            stored_seen.insert(d);
        }
        EXPECT_EQ(stored_seen, std::multiset<DeviceRef>(stored.begin(), stored.end())) << "round " << round;
    }
}

TEST(DeviceFormatTest, IpValidation) {
    EXPECT_TRUE(netpilot::is_valid_ip("10.0.0.5"));
    EXPECT_TRUE(netpilot::is_valid_ip("fe80::1"));
    EXPECT_FALSE(netpilot::is_valid_ip("10.0.0.256"));
    EXPECT_FALSE(netpilot::is_valid_ip("10.0.0"));
    EXPECT_FALSE(netpilot::is_valid_ip(""));
}

TEST(DeviceFormatTest, MacValidationAndNormalization) {
    EXPECT_TRUE(netpilot::is_valid_mac("aa:bb:cc:dd:ee:01"));
    EXPECT_TRUE(netpilot::is_valid_mac("AA-BB-CC-DD-EE-01"));
    EXPECT_FALSE(netpilot::is_valid_mac("aa:bb-cc:dd:ee:01"));
    EXPECT_FALSE(netpilot::is_valid_mac("aa:bb:cc:dd:ee"));
    EXPECT_FALSE(netpilot::is_valid_mac("gg:bb:cc:dd:ee:01"));
    EXPECT_EQ(netpilot::normalize_mac("AA-BB-CC-DD-EE-01"), "aa:bb:cc:dd:ee:01");
}

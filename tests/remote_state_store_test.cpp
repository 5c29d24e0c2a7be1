#include "gtest/gtest.h"
#include "fake_router.hpp"
#include "netpilot/errors.hpp"
#include "netpilot/remote_state_store.hpp"
#include "netpilot/state_document.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>
#include <vector>

using namespace netpilot;

class RemoteStateStoreTest : public ::testing::Test {
protected:
    netpilot_test::ControlPlaneHarness harness;
    RemoteStateStore& store = harness.store;

    PolicyGroup make_group(int id, std::vector<DeviceRef> devices) {
        PolicyGroup group;
        group.group_id = id;
        group.name = "Group " + std::to_string(id);
        group.devices = std::move(devices);
        return group;
    }

    nlohmann::json stored_json() {
        return nlohmann::json::parse(harness.router.file(harness.state_path()));
    }
};

TEST_F(RemoteStateStoreTest, MissingDocumentIsCreatedWithGuestGroup) {
    EXPECT_FALSE(harness.router.has_file(harness.state_path()));
    RemoteStateDocument document = store.load();

    ASSERT_EQ(document.groups.size(), 1u);
    const PolicyGroup* guest = document.find_group(0);
    ASSERT_NE(guest, nullptr);
    EXPECT_EQ(guest->name, "Guest Group");
    ASSERT_TRUE(guest->bandwidth.allocation.has_value());
    EXPECT_EQ(guest->bandwidth.allocation->tc_class_id, "1:100");
    EXPECT_EQ(document.infrastructure.next_class_id, 101u);

    ASSERT_TRUE(harness.router.has_file(harness.state_path()));
    EXPECT_FALSE(harness.router.has_file(harness.state_path() + ".tmp"));
    nlohmann::json j = stored_json();
    EXPECT_TRUE(j["groups"].contains("0"));
    EXPECT_EQ(j["infrastructure"]["next_class_id"], 101);
}

TEST_F(RemoteStateStoreTest, MalformedDocumentIsReplacedByDefaults) {
    harness.router.put_file(harness.state_path(), "{\"groups\": [1, 2");
    RemoteStateDocument document = store.load();
    EXPECT_EQ(document.groups.size(), 1u);
    EXPECT_NO_THROW(stored_json());

    // Valid JSON without group 0 is rejected the same way.
    harness.router.put_file(harness.state_path(), "{\"groups\": {}, \"infrastructure\": {\"next_class_id\": 101}}");
    document = store.load();
    EXPECT_NE(document.find_group(0), nullptr);
}

TEST_F(RemoteStateStoreTest, SaveAndReadBackGroup) {
    PolicyGroup group = make_group(5, {{"10.0.0.5", "aa:bb:cc:dd:ee:05"}});
    group.bandwidth.limit_mbps = 25;
    group.access_control.blocked_sites = {"example.com"};
    TimeBasedPolicy night;
    night.name = "night";
    night.start_time = "22:00";
    night.end_time = "06:00";
    night.days = {"mon", "tue"};
    night.action = "block";
    group.time_based.push_back(night);
    store.save_group(group);

    std::optional<PolicyGroup> loaded = store.get_group(5);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->devices, group.devices);
    EXPECT_EQ(loaded->bandwidth.limit_mbps.value_or(0), 25u);
    EXPECT_EQ(loaded->access_control.blocked_sites, group.access_control.blocked_sites);
    ASSERT_EQ(loaded->time_based.size(), 1u);
    EXPECT_EQ(loaded->time_based[0].start_time, "22:00");
    EXPECT_EQ(store.list_groups().size(), 2u);
    EXPECT_FALSE(store.get_group(6).has_value());
}

TEST_F(RemoteStateStoreTest, GuestGroupMustKeepReservedClass) {
    PolicyGroup guest = make_default_group(100);
    guest.bandwidth.allocation = ClassAllocation::for_number(150);
    EXPECT_THROW(store.save_group(guest), ProtectedGroupError);
}

TEST_F(RemoteStateStoreTest, RevisionIncreasesOnEveryWrite) {
    uint64_t first = store.load().revision;
    store.mark_base_setup_complete(true);
    RemoteStateDocument document = store.load();
    EXPECT_GT(document.revision, first);
    EXPECT_TRUE(document.infrastructure.base_setup_complete);
}

TEST_F(RemoteStateStoreTest, FreshStateReportsEveryDeviceAdded) {
    std::vector<DeviceRef> devices = {{"10.0.0.5", "aa:bb:cc:dd:ee:05"}, {"10.0.0.6", "aa:bb:cc:dd:ee:06"}};
    DeviceVerificationResult result = store.verify_devices(5, devices);
    EXPECT_TRUE(result.is_valid);
    EXPECT_FALSE(result.group_exists);
    EXPECT_EQ(result.delta.added, devices);
}

TEST_F(RemoteStateStoreTest, StoredDeviceWithNewIpIsIpChange) {
    store.save_group(make_group(3, {{"10.0.0.9", "aa:bb:cc:dd:ee:02"}}));
    DeviceDelta delta = store.get_device_changes(3, {{"10.0.0.10", "aa:bb:cc:dd:ee:02"}});
    ASSERT_EQ(delta.ip_changed.size(), 1u);
    EXPECT_EQ(delta.ip_changed[0].first.ip, "10.0.0.9");
    EXPECT_EQ(delta.ip_changed[0].second.ip, "10.0.0.10");
    EXPECT_TRUE(delta.added.empty());
    EXPECT_TRUE(delta.removed.empty());
}

TEST_F(RemoteStateStoreTest, MacOwnedByAnotherGroupIsDuplicate) {
    store.save_group(make_group(7, {{"10.0.0.7", "aa:bb:cc:dd:ee:07"}}));
    DeviceVerificationResult result = store.verify_devices(9, {{"10.0.0.99", "AA-BB-CC-DD-EE-07"}});
    EXPECT_FALSE(result.is_valid);
    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, ErrorKind::DUPLICATE_DEVICE);
    EXPECT_EQ(result.conflicting_group.value_or(-1), 7);
    EXPECT_NE(result.error_message.find("group 7"), std::string::npos);

    // The owning group may keep its own device.
    EXPECT_TRUE(store.verify_devices(7, {{"10.0.0.7", "aa:bb:cc:dd:ee:07"}}).is_valid);
}

TEST_F(RemoteStateStoreTest, MalformedDevicesAreInvalidFormat) {
    DeviceVerificationResult bad_ip = store.verify_devices(4, {{"10.0.0.300", "aa:bb:cc:dd:ee:01"}});
    EXPECT_EQ(bad_ip.error_kind.value_or(ErrorKind::CONFIGURATION), ErrorKind::INVALID_FORMAT);

    DeviceVerificationResult bad_mac = store.verify_devices(4, {{"10.0.0.3", "aa:bb:cc"}});
    EXPECT_EQ(bad_mac.error_kind.value_or(ErrorKind::CONFIGURATION), ErrorKind::INVALID_FORMAT);

    DeviceVerificationResult mismatched = store.verify_devices(4, std::vector<std::string>{"10.0.0.3"},
                                                               std::vector<std::string>{});
    EXPECT_EQ(mismatched.error_kind.value_or(ErrorKind::CONFIGURATION), ErrorKind::INVALID_FORMAT);
}

TEST_F(RemoteStateStoreTest, DeviceListedTwiceInRequestIsDuplicate) {
    DeviceVerificationResult result =
        store.verify_devices(4, {{"10.0.0.3", "aa:bb:cc:dd:ee:01"}, {"10.0.0.4", "aa:bb:cc:dd:ee:01"}});
    EXPECT_EQ(result.error_kind.value_or(ErrorKind::CONFIGURATION), ErrorKind::DUPLICATE_DEVICE);
}

TEST_F(RemoteStateStoreTest, DeletingGuestGroupIsRefused) {
    EXPECT_THROW(store.delete_group(0), ProtectedGroupError);
    EXPECT_NE(store.load().find_group(0), nullptr);
}

TEST_F(RemoteStateStoreTest, DeleteMovesDevicesToGuestGroupAndReleasesClass) {
    PolicyGroup group = make_group(4, {{"10.0.0.4", "aa:bb:cc:dd:ee:04"}});
    group.bandwidth.limit_mbps = 10;
    group.bandwidth.allocation = store.allocate_class();
    store.save_group(group);

    EXPECT_TRUE(store.delete_group(4));
    RemoteStateDocument document = store.load();
    EXPECT_EQ(document.find_group(4), nullptr);
    ASSERT_EQ(document.find_group(0)->devices.size(), 1u);
    EXPECT_EQ(document.find_group(0)->devices[0].mac, "aa:bb:cc:dd:ee:04");
    EXPECT_EQ(document.infrastructure.next_class_id, 101u);

    EXPECT_FALSE(store.delete_group(4));
}

TEST_F(RemoteStateStoreTest, AllocateAndReleaseClasses) {
    ClassAllocation a = store.allocate_class();
    ClassAllocation b = store.allocate_class();
    ClassAllocation c = store.allocate_class();
    EXPECT_EQ(a.tc_class_id, "1:101");
    EXPECT_EQ(b.mark_value, 102u);
    EXPECT_EQ(c.tc_class_id, "1:103");

    EXPECT_TRUE(store.release_class(b));
    EXPECT_FALSE(store.release_class(b));
    EXPECT_EQ(store.load().infrastructure.available_class_pool, std::vector<uint32_t>{102});
    EXPECT_EQ(store.allocate_class().mark_value, 102u);

    // Giving back the newest id rewinds the counter.
    EXPECT_TRUE(store.release_class(c));
    EXPECT_EQ(store.load().infrastructure.next_class_id, 103u);
    EXPECT_EQ(store.allocate_class().mark_value, 103u);
}

TEST_F(RemoteStateStoreTest, ReleasingReservedOrForeignClassIsIgnored) {
    EXPECT_FALSE(store.release_class(ClassAllocation::for_number(100)));
    EXPECT_FALSE(store.release_class(ClassAllocation::for_number(5)));
    EXPECT_FALSE(store.release_class(ClassAllocation::for_number(150)));
    RemoteStateDocument document = store.load();
    EXPECT_TRUE(document.infrastructure.available_class_pool.empty());
    EXPECT_EQ(document.infrastructure.next_class_id, 101u);
}

TEST_F(RemoteStateStoreTest, ClassStillAssignedIsNotReleased) {
    PolicyGroup group = make_group(2, {});
    group.bandwidth.limit_mbps = 5;
    group.bandwidth.allocation = store.allocate_class();
    store.save_group(group);
    EXPECT_FALSE(store.release_class(*group.bandwidth.allocation));
}

TEST_F(RemoteStateStoreTest, PoolExhaustsAfterEveryManagedId) {
    int allocated = 0;
    int exhausted = 0;
    for (int i = 0; i < 900; ++i) {
        try {
            store.allocate_class();
            allocated++;
        } catch (const PoolExhaustedError&) {
            exhausted++;
        }
    }
    EXPECT_EQ(allocated, 898);
    EXPECT_EQ(exhausted, 2);
    EXPECT_EQ(store.load().infrastructure.next_class_id, 999u);
}

TEST_F(RemoteStateStoreTest, FailedWriteThrowsAndKeepsOldDocument) {
    store.save_group(make_group(3, {}));
    const std::string before = harness.router.file(harness.state_path());

    harness.router.fail_with("cat >", "sh: can't create /etc/config/x.tmp: Read-only file system");
    try {
        store.save_group(make_group(8, {}));
        FAIL() << "Expected CommandFailureError";
    } catch (const CommandFailureError& e) {
        EXPECT_EQ(e.phase(), "ensure_state");
        EXPECT_NE(e.output().find("Read-only"), std::string::npos);
    }
    EXPECT_EQ(harness.router.file(harness.state_path()), before);
}

namespace {
// Forwards to the device but makes state writes exit non-zero without any
// output, as when the remote shell cannot be started.
class SilentWriteFailure : public CommandRunner {
public:
    explicit SilentWriteFailure(CommandRunner& inner) : inner_(inner) {}

    using CommandRunner::run;
    CommandOutput run(const std::string& command, const std::string& input) override {
        if (command.rfind("cat >", 0) == 0) {
            return {"", "", 127};
        }
        return inner_.run(command, input);
    }

private:
    CommandRunner& inner_;
};
}

TEST_F(RemoteStateStoreTest, WriteWithoutConfirmationIsAFailure) {
    store.save_group(make_group(3, {}));
    const std::string before = harness.router.file(harness.state_path());

    SilentWriteFailure failing(harness.runner);
    RemoteStateStore silent_store(failing, harness.options, harness.logger);
    try {
        silent_store.save_group(make_group(8, {}));
        FAIL() << "Expected CommandFailureError";
    } catch (const CommandFailureError& e) {
        EXPECT_EQ(e.phase(), "ensure_state");
        EXPECT_NE(e.output().find("exit status 127"), std::string::npos);
    }
    EXPECT_EQ(harness.router.file(harness.state_path()), before);
    EXPECT_FALSE(store.get_group(8).has_value());
}

TEST_F(RemoteStateStoreTest, LargeDocumentIsWrittenWhole) {
    store.update([](RemoteStateDocument& document) {
        for (int id = 1; id <= 400; ++id) {
            PolicyGroup group;
            group.group_id = id;
            group.name = "Group " + std::to_string(id);
            for (int d = 0; d < 4; ++d) {
                char mac[18];
                std::snprintf(mac, sizeof(mac), "aa:bb:cc:%02x:%02x:%02x", id >> 8, id & 0xff, d);
                group.devices.push_back({"10." + std::to_string(d) + "." + std::to_string(id >> 8) + "." +
                                         std::to_string(id & 0xff), mac});
            }
            document.groups[id] = group;
        }
    });

    // Well past the 128 KiB limit on a single command-line argument.
    EXPECT_GT(harness.router.file(harness.state_path()).size(), 131072u);
    EXPECT_EQ(store.list_groups().size(), 401u);
    EXPECT_EQ(store.get_group(400)->devices.size(), 4u);
    for (const auto& command : harness.router.log()) {
        EXPECT_LT(command.size(), 1024u);
    }
}

TEST_F(RemoteStateStoreTest, UpdateIsReadModifyWrite) {
    store.update([](RemoteStateDocument& document) {
        document.groups[12] = PolicyGroup();
        document.groups[12].group_id = 12;
        document.groups[12].name = "Lab";
    });
    EXPECT_EQ(store.get_group(12)->name, "Lab");

    RemoteStateDocument reset = store.reset_to_default();
    EXPECT_EQ(reset.groups.size(), 1u);
    EXPECT_FALSE(store.get_group(12).has_value());
}

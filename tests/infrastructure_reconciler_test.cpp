#include "gtest/gtest.h"
#include "fake_router.hpp"
#include "netpilot/errors.hpp"
#include "netpilot/infrastructure_reconciler.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace netpilot;
using Component = InfrastructureComponent;

class InfrastructureReconcilerTest : public ::testing::Test {
protected:
    netpilot_test::ControlPlaneHarness harness;
    netpilot_test::FakeRouter& router = harness.router;
    InfrastructureReconciler reconciler{harness.executor, harness.store, harness.layout, harness.logger};

    static bool contains(const std::vector<Component>& list, Component c) {
        return std::find(list.begin(), list.end(), c) != list.end();
    }
    static bool contains(const std::vector<std::string>& list, const std::string& text) {
        return std::find(list.begin(), list.end(), text) != list.end();
    }

    void expect_shaping_on(const std::string& iface) {
        EXPECT_TRUE(router.has_qdisc(iface)) << iface;
        auto classes = router.classes(iface);
        EXPECT_EQ(classes["1:1"], "1000mbit") << iface;
        EXPECT_EQ(classes["1:10"], "50mbit") << iface;
        auto filters = router.filters(iface);
        EXPECT_EQ(filters["1/1"], "1:1") << iface;
        EXPECT_EQ(filters["2/98"], "1:10") << iface;
    }
};

TEST_F(InfrastructureReconcilerTest, FreshDeviceMissesEverything) {
    InfrastructureReport report = reconciler.check_existing();
    EXPECT_FALSE(report.all_satisfied);
    EXPECT_EQ(report.missing, all_infrastructure_components());
    EXPECT_EQ(report.details[Component::ALLOW_CHAIN], "chain NETPILOT_WHITELIST missing");
    EXPECT_EQ(report.details[Component::TC_SETUP], "0 of 2 shaping classes on eth0");
}

TEST_F(InfrastructureReconcilerTest, CheckIsReadOnlyAndRepeatable) {
    InfrastructureReport first = reconciler.check_existing();
    InfrastructureReport second = reconciler.check_existing();
    EXPECT_EQ(first.missing, second.missing);
    EXPECT_EQ(first.details, second.details);

    EXPECT_FALSE(router.has_file(harness.state_path()));
    EXPECT_EQ(router.count_commands(" -N "), 0u);
    EXPECT_EQ(router.count_commands("tc qdisc"), 0u);
}

TEST_F(InfrastructureReconcilerTest, EnsureBuildsAllScaffolding) {
    router.add_nft_table("inet", "netpilot");
    SetupResult result = reconciler.ensure(false);

    EXPECT_EQ(result.created.size(), 4u);
    EXPECT_TRUE(result.bundle.requires_restart);
    EXPECT_TRUE(router.has_file(harness.state_path()));
    EXPECT_TRUE(router.has_chain("NETPILOT_WHITELIST"));
    EXPECT_TRUE(router.has_chain("NETPILOT_BLACKLIST"));
    expect_shaping_on("eth0");
    expect_shaping_on("br-lan");
    EXPECT_FALSE(router.has_qdisc("lo"));
    EXPECT_FALSE(router.has_nft_table("inet", "netpilot"));
    EXPECT_TRUE(harness.store.load().infrastructure.base_setup_complete);

    EXPECT_TRUE(contains(result.bundle.iptables_commands, "iptables -t mangle -N NETPILOT_WHITELIST"));
    EXPECT_TRUE(contains(result.bundle.tc_commands, "tc qdisc add dev eth0 root handle 1: htb default 1"));
    EXPECT_TRUE(contains(result.bundle.cleanup_commands, "nft delete table inet netpilot"));

    EXPECT_TRUE(reconciler.check_existing().all_satisfied);
}

TEST_F(InfrastructureReconcilerTest, SecondEnsureChangesNothing) {
    reconciler.ensure(false);
    router.clear_log();

    SetupResult again = reconciler.ensure(false);
    EXPECT_TRUE(again.created.empty());
    EXPECT_FALSE(again.bundle.requires_restart);
    EXPECT_EQ(again.bundle.command_count(), 0u);
    EXPECT_EQ(router.count_commands(" -N "), 0u);
    EXPECT_EQ(router.count_commands("tc qdisc"), 0u);
    EXPECT_EQ(router.count_commands("cat >"), 0u);
}

TEST_F(InfrastructureReconcilerTest, OnlyMissingComponentsAreCreated) {
    harness.store.load();
    router.add_chain("NETPILOT_WHITELIST");
    router.add_rule("NETPILOT_WHITELIST", "-j MARK --set-mark 98");

    SetupResult result = reconciler.ensure(false);
    EXPECT_FALSE(contains(result.created, Component::STATE_FILE));
    EXPECT_FALSE(contains(result.created, Component::ALLOW_CHAIN));
    EXPECT_TRUE(contains(result.created, Component::DENY_CHAIN));
    EXPECT_TRUE(contains(result.created, Component::TC_SETUP));
    EXPECT_EQ(router.count_commands("-N NETPILOT_WHITELIST"), 0u);
    // Existing rules are left alone.
    EXPECT_EQ(router.rules("NETPILOT_WHITELIST").size(), 1u);
}

TEST_F(InfrastructureReconcilerTest, ForcedEnsureRebuildsOverExistingState) {
    reconciler.ensure(false);
    SetupResult forced = reconciler.ensure(true);
    EXPECT_EQ(forced.created, all_infrastructure_components());
    EXPECT_TRUE(forced.bundle.requires_restart);
    expect_shaping_on("eth0");
    // Already-present chains and a missing nft table are idempotent.
    EXPECT_TRUE(forced.bundle.warnings.empty());
}

TEST_F(InfrastructureReconcilerTest, ShapingToleratesOneBrokenInterface) {
    router.fail_with("dev br-lan", "RTNETLINK answers: Operation not permitted");
    SetupResult result = reconciler.ensure(false);
    expect_shaping_on("eth0");
    EXPECT_FALSE(router.has_qdisc("br-lan"));
    EXPECT_TRUE(contains(result.bundle.warnings, "shaping setup failed on br-lan"));
}

TEST_F(InfrastructureReconcilerTest, ShapingFailsWhenNoInterfaceWorks) {
    router.fail_with("tc qdisc add", "RTNETLINK answers: Operation not permitted");
    try {
        reconciler.setup({Component::TC_SETUP});
        FAIL() << "Expected CommandFailureError";
    } catch (const CommandFailureError& e) {
        EXPECT_EQ(e.phase(), "rebuild");
        EXPECT_NE(e.output().find("Operation not permitted"), std::string::npos);
    }
}

TEST_F(InfrastructureReconcilerTest, NoInterfacesIsReportedAndFatalForSetup) {
    router.set_interfaces({"lo"});
    InfrastructureReport report = reconciler.check_existing();
    EXPECT_TRUE(contains(report.missing, Component::TC_SETUP));
    EXPECT_EQ(report.details[Component::TC_SETUP], "no network interfaces found");
    EXPECT_THROW(reconciler.setup({Component::TC_SETUP}), CommandFailureError);
}

TEST_F(InfrastructureReconcilerTest, FailedCheckDoesNotSkipOthers) {
    harness.store.load();
    router.fail_transport("ls /sys/class/net");
    InfrastructureReport report = reconciler.check_existing();
    EXPECT_TRUE(contains(report.missing, Component::TC_SETUP));
    EXPECT_FALSE(contains(report.missing, Component::STATE_FILE));
    EXPECT_TRUE(contains(report.missing, Component::DENY_CHAIN));
    EXPECT_EQ(report.details[Component::TC_SETUP].rfind("check failed: ", 0), 0u);
}

TEST(InfrastructureComponentTest, Names) {
    EXPECT_EQ(component_to_string(Component::STATE_FILE), "state_file");
    EXPECT_EQ(component_to_string(Component::TC_SETUP), "tc_setup");
    EXPECT_EQ(all_infrastructure_components().size(), 4u);
}

#ifndef NETPILOT_INFRASTRUCTURE_RECONCILER_HPP
#define NETPILOT_INFRASTRUCTURE_RECONCILER_HPP

#include "netpilot/command_runner.hpp"
#include "netpilot/firewall_layout.hpp"
#include "netpilot/logger.hpp"
#include "netpilot/remote_state_store.hpp"
#include "netpilot/router_command_bundle.hpp"

#include <map>
#include <string>
#include <vector>

namespace netpilot {

enum class InfrastructureComponent {
    STATE_FILE,
    ALLOW_CHAIN,
    DENY_CHAIN,
    TC_SETUP
};

std::string component_to_string(InfrastructureComponent component);
const std::vector<InfrastructureComponent>& all_infrastructure_components();

struct InfrastructureReport {
    bool all_satisfied = false;
    std::vector<InfrastructureComponent> missing;
    std::map<InfrastructureComponent, std::string> details;
};

struct SetupResult {
    std::vector<InfrastructureComponent> created;
    RouterCommandBundle bundle;
};

// Checks the device's scaffolding piece by piece and creates only what is
// missing.
class InfrastructureReconciler {
public:
    InfrastructureReconciler(PlanExecutor& executor, RemoteStateStore& store, FirewallLayout layout,
                             PilotLogger& logger);

    // Checks every component; one failing check does not skip the others.
    InfrastructureReport check_existing();

    // Creates the listed components, then drops the legacy nftables table
    // when anything was created.
    SetupResult setup(const std::vector<InfrastructureComponent>& missing);

    // restart=false: check_existing() then setup() of what is missing.
    // restart=true: setup() of every component.
    SetupResult ensure(bool restart);

    // Interfaces shaping is applied to.
    std::vector<std::string> discover_interfaces(Phase phase);

private:
    bool chain_exists(const std::string& chain, std::string& detail);
    bool shaping_classes_present(std::string& detail);
    void setup_shaping(const std::vector<std::string>& interfaces, RouterCommandBundle& bundle);
    void drop_legacy_scaffolding(RouterCommandBundle& bundle);

    PlanExecutor& executor_;
    RemoteStateStore& store_;
    FirewallLayout layout_;
    PilotLogger& logger_;
};

} // namespace netpilot

#endif // NETPILOT_INFRASTRUCTURE_RECONCILER_HPP

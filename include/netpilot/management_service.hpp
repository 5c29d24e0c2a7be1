#ifndef NETPILOT_MANAGEMENT_SERVICE_HPP
#define NETPILOT_MANAGEMENT_SERVICE_HPP

#include "netpilot/group_sync_service.hpp"
#include "netpilot/infrastructure_reconciler.hpp"
#include "netpilot/logger.hpp"
#include "netpilot/management_interface.hpp"
#include "netpilot/mode_activation_engine.hpp"
#include "netpilot/remote_state_store.hpp"
#include "netpilot/router_command_bundle.hpp"

#include <optional>
#include <string>
#include <vector>

namespace netpilot {

// Binds the control-plane operations for one device to CLI words.
class ManagementService {
public:
    ManagementService(PilotLogger& logger, ManagementInterface& mi, ModeActivationEngine& engine,
                      InfrastructureReconciler& reconciler, RemoteStateStore& store, GroupSyncService& sync);

    void register_cli_commands();

    static std::string format_bundle(const RouterCommandBundle& bundle);
    static std::string format_group(const PolicyGroup& group);
    static std::string format_report(const InfrastructureReport& report);
    static std::string format_verification(const DeviceVerificationResult& result);

    // "10.0.0.5,aa:bb:cc:dd:ee:01"
    static std::optional<DeviceRef> parse_device_token(const std::string& token);

private:
    std::string handle_mode_command(const std::string& verb, const std::vector<std::string>& args);
    std::string handle_infra_command(const std::string& verb, const std::vector<std::string>& args);
    std::string handle_group_sync(const std::vector<std::string>& args);
    std::string handle_group_delete(const std::vector<std::string>& args);
    std::string handle_group_show(const std::vector<std::string>& args);
    std::string handle_group_verify(const std::vector<std::string>& args);
    std::string handle_rates_set(const std::vector<std::string>& args);

    PilotLogger& logger_;
    ManagementInterface& management_interface_;
    ModeActivationEngine& engine_;
    InfrastructureReconciler& reconciler_;
    RemoteStateStore& store_;
    GroupSyncService& sync_;
};

} // namespace netpilot

#endif // NETPILOT_MANAGEMENT_SERVICE_HPP

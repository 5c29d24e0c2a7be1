#include "netpilot/allocation_directory.hpp"
#include "netpilot/command_classifier.hpp"
#include "netpilot/command_runner.hpp"
#include "netpilot/config_manager.hpp"
#include "netpilot/connection_pool.hpp"
#include "netpilot/errors.hpp"
#include "netpilot/firewall_layout.hpp"
#include "netpilot/group_sync_service.hpp"
#include "netpilot/infrastructure_reconciler.hpp"
#include "netpilot/logger.hpp"
#include "netpilot/management_interface.hpp"
#include "netpilot/management_service.hpp"
#include "netpilot/mode_activation_engine.hpp"
#include "netpilot/remote_state_store.hpp"
#include "netpilot/ssh_connection.hpp"

#include <unistd.h>

#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <config_file> <device_id> <command...>\n"
              << "       " << program << " <config_file> <device_id> help" << std::endl;
}

netpilot::LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return netpilot::LogLevel::DEBUG;
    if (name == "warning") return netpilot::LogLevel::WARNING;
    if (name == "error") return netpilot::LogLevel::ERROR;
    if (name == "critical") return netpilot::LogLevel::CRITICAL;
    return netpilot::LogLevel::INFO;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 2;
    }

    const std::string config_file = argv[1];
    const std::string device_id = argv[2];
    const std::vector<std::string> command(argv + 3, argv + argc);

    netpilot::PilotLogger logger(netpilot::LogLevel::WARNING);
    netpilot::ConfigManager config;
    config.set_logger(&logger);
    if (!config.load_config(config_file)) {
        logger.critical("MAIN", "Cannot read configuration file " + config_file);
        return 1;
    }
    if (auto level = config.get_string("log.level")) {
        logger.set_min_log_level(parse_log_level(*level));
    }

    netpilot::PilotSettings settings;
    try {
        settings = netpilot::load_settings(config);
    } catch (const netpilot::ConfigurationError& e) {
        logger.critical("MAIN", e.what());
        return 1;
    }

    netpilot::StaticAllocationDirectory directory(logger);
    directory.load_from_config(config);

    netpilot::SshOptions ssh_options;
    ssh_options.ssh_binary = settings.ssh_binary;
    ssh_options.control_dir = settings.ssh_control_dir;
    ssh_options.connect_timeout = settings.connect_timeout;
    netpilot::SshConnectionFactory factory(ssh_options, logger);

    netpilot::PoolOptions pool_options;
    pool_options.connection_idle = settings.connection_idle;
    pool_options.session_idle = settings.session_idle;
    pool_options.reaper_interval = settings.reaper_interval;
    netpilot::ConnectionPool pool(factory, directory, logger, pool_options);
    pool.start_reaper();

    const std::string session_id = "netpilotd-" + std::to_string(::getpid());
    pool.start_session(session_id);

    netpilot::DeviceLockTable locks;
    netpilot::PooledCommandRunner runner(pool, session_id, device_id, settings.command_timeout);
    netpilot::CommandClassifier classifier;
    netpilot::PlanExecutor executor(runner, classifier, logger);
    netpilot::RemoteStateStore store(runner, netpilot::StateStoreOptions::from_settings(settings), logger,
                                     locks.lock_for(device_id));
    const netpilot::FirewallLayout layout = netpilot::FirewallLayout::from_settings(settings);
    netpilot::InfrastructureReconciler reconciler(executor, store, layout, logger);
    netpilot::ModeActivationEngine engine(executor, store, reconciler, layout, logger);
    netpilot::GroupSyncService sync(executor, store, reconciler, layout, logger);

    netpilot::ManagementInterface management_interface;
    netpilot::ManagementService management_service(logger, management_interface, engine, reconciler, store, sync);
    management_service.register_cli_commands();

    std::string output = management_interface.handle_cli_command(command);
    std::cout << output << std::endl;

    pool.end_session(session_id);
    pool.stop_reaper();
    pool.shutdown();

    return output.rfind("Error:", 0) == 0 ? 1 : 0;
}

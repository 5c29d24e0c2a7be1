#include "netpilot/infrastructure_reconciler.hpp"
#include "netpilot/errors.hpp"

#include <algorithm>
#include <sstream>

namespace netpilot {

std::string component_to_string(InfrastructureComponent component) {
    switch (component) {
        case InfrastructureComponent::STATE_FILE:  return "state_file";
        case InfrastructureComponent::ALLOW_CHAIN: return "allow_chain";
        case InfrastructureComponent::DENY_CHAIN:  return "deny_chain";
        case InfrastructureComponent::TC_SETUP:    return "tc_setup";
        default:                                   return "unknown";
    }
}

const std::vector<InfrastructureComponent>& all_infrastructure_components() {
    static const std::vector<InfrastructureComponent> components = {
        InfrastructureComponent::STATE_FILE,
        InfrastructureComponent::ALLOW_CHAIN,
        InfrastructureComponent::DENY_CHAIN,
        InfrastructureComponent::TC_SETUP,
    };
    return components;
}

InfrastructureReconciler::InfrastructureReconciler(PlanExecutor& executor, RemoteStateStore& store,
                                                   FirewallLayout layout, PilotLogger& logger)
    : executor_(executor), store_(store), layout_(std::move(layout)), logger_(logger) {}

std::vector<std::string> InfrastructureReconciler::discover_interfaces(Phase phase) {
    CommandOutput listing = executor_.run(phase, ops::ListInterfaces{});
    return parse_interface_list(listing.output);
}

bool InfrastructureReconciler::chain_exists(const std::string& chain, std::string& detail) {
    CommandOutput result = executor_.run(Phase::ENSURE_STATE, ops::ListChain{layout_.table, chain});
    if (result.error_output.find_first_not_of(" \t\r\n") == std::string::npos) {
        detail = "chain " + chain + " present";
        return true;
    }
    detail = "chain " + chain + " missing";
    return false;
}

bool InfrastructureReconciler::shaping_classes_present(std::string& detail) {
    std::vector<std::string> interfaces = discover_interfaces(Phase::ENSURE_STATE);
    if (interfaces.empty()) {
        detail = "no network interfaces found";
        return false;
    }

    const std::string& sample_interface = interfaces.front();
    CommandOutput result = executor_.run(Phase::ENSURE_STATE, ops::ShowClasses{sample_interface});

    // "class htb 1:10 root prio 0 rate 50Mbit ..."
    int found = 0;
    std::istringstream lines(result.output);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string word, kind, id;
        if (!(fields >> word >> kind >> id) || word != "class") continue;
        if (id == layout_.unrestricted_class || id == layout_.limited_class) {
            found++;
        }
    }

    detail = std::to_string(found) + " of 2 shaping classes on " + sample_interface;
    return found >= 2;
}

InfrastructureReport InfrastructureReconciler::check_existing() {
    InfrastructureReport report;

    for (InfrastructureComponent component : all_infrastructure_components()) {
        bool present = false;
        std::string detail;
        try {
            switch (component) {
                case InfrastructureComponent::STATE_FILE: {
                    CommandOutput exists = executor_.run(Phase::ENSURE_STATE,
                                                         ops::FileExists{store_.options().state_file_path});
                    std::string answer;
                    std::istringstream(exists.output) >> answer;
                    present = answer == "exists";
                    detail = store_.options().state_file_path + (present ? " present" : " missing");
                    break;
                }
                case InfrastructureComponent::ALLOW_CHAIN:
                    present = chain_exists(layout_.allow_chain, detail);
                    break;
                case InfrastructureComponent::DENY_CHAIN:
                    present = chain_exists(layout_.deny_chain, detail);
                    break;
                case InfrastructureComponent::TC_SETUP:
                    present = shaping_classes_present(detail);
                    break;
            }
        } catch (const PilotError& e) {
            present = false;
            detail = std::string("check failed: ") + e.what();
        }

        report.details[component] = detail;
        if (!present) {
            report.missing.push_back(component);
        }
    }

    report.all_satisfied = report.missing.empty();
    logger_.info("InfrastructureReconciler", report.all_satisfied
                     ? std::string("All infrastructure present")
                     : std::to_string(report.missing.size()) + " infrastructure components missing");
    return report;
}

void InfrastructureReconciler::setup_shaping(const std::vector<std::string>& interfaces, RouterCommandBundle& bundle) {
    if (interfaces.empty()) {
        throw CommandFailureError(phase_to_string(Phase::REBUILD), render(ops::ListInterfaces{}),
                                  "no network interfaces found");
    }

    std::size_t configured = 0;
    std::string first_error;
    for (const auto& iface : interfaces) {
        CommandPlan plan;
        plan.add(Phase::TEARDOWN, ops::DeleteRootQdisc{iface})
            .add(Phase::REBUILD, ops::AddRootQdisc{iface, layout_.unrestricted_class.substr(2)})
            .add(Phase::REBUILD, ops::ShapingClass{ops::ClassAction::ADD, iface, layout_.unrestricted_class,
                                                   layout_.unrestricted_rate})
            .add(Phase::REBUILD, ops::ShapingClass{ops::ClassAction::ADD, iface, layout_.limited_class,
                                                   layout_.limited_rate})
            .add(Phase::REBUILD, ops::MarkFilter{false, iface, layout_.unrestricted_filter_prio,
                                                 layout_.unrestricted_mark, layout_.unrestricted_class})
            .add(Phase::REBUILD, ops::MarkFilter{false, iface, layout_.limited_filter_prio,
                                                 layout_.limited_mark, layout_.limited_class});
        try {
            executor_.execute(plan);
            configured++;
        } catch (const CommandFailureError& e) {
            logger_.warning("InfrastructureReconciler", "Shaping setup failed on " + iface + ": " + e.what());
            bundle.warnings.push_back("shaping setup failed on " + iface);
            if (first_error.empty()) first_error = e.what();
        }
    }

    if (configured == 0) {
        throw CommandFailureError(phase_to_string(Phase::REBUILD), "shaping setup", first_error);
    }
    logger_.info("InfrastructureReconciler", "Shaping configured on " + std::to_string(configured) + "/" +
                 std::to_string(interfaces.size()) + " interfaces");
}

void InfrastructureReconciler::drop_legacy_scaffolding(RouterCommandBundle& bundle) {
    try {
        executor_.run(Phase::REBUILD, ops::DropNftTable{layout_.legacy_nft_family, layout_.legacy_nft_table});
    } catch (const PilotError& e) {
        logger_.debug("InfrastructureReconciler", std::string("Legacy cleanup skipped: ") + e.what());
        bundle.warnings.push_back("legacy nftables cleanup skipped");
    }
}

SetupResult InfrastructureReconciler::setup(const std::vector<InfrastructureComponent>& missing) {
    SetupResult result;
    const std::size_t mark = executor_.history_mark();

    auto wants = [&](InfrastructureComponent c) {
        return std::find(missing.begin(), missing.end(), c) != missing.end();
    };

    if (wants(InfrastructureComponent::STATE_FILE)) {
        // Self-healing load writes the default document only when needed.
        store_.load();
        result.created.push_back(InfrastructureComponent::STATE_FILE);
    }
    if (wants(InfrastructureComponent::ALLOW_CHAIN)) {
        executor_.run(Phase::REBUILD, ops::CreateChain{layout_.table, layout_.allow_chain});
        result.created.push_back(InfrastructureComponent::ALLOW_CHAIN);
    }
    if (wants(InfrastructureComponent::DENY_CHAIN)) {
        executor_.run(Phase::REBUILD, ops::CreateChain{layout_.table, layout_.deny_chain});
        result.created.push_back(InfrastructureComponent::DENY_CHAIN);
    }
    if (wants(InfrastructureComponent::TC_SETUP)) {
        setup_shaping(discover_interfaces(Phase::REBUILD), result.bundle);
        result.created.push_back(InfrastructureComponent::TC_SETUP);
    }

    if (!result.created.empty()) {
        drop_legacy_scaffolding(result.bundle);
        store_.mark_base_setup_complete(true);
        result.bundle.requires_restart = true;
        std::string names;
        for (auto c : result.created) {
            if (!names.empty()) names += ", ";
            names += component_to_string(c);
        }
        logger_.info("InfrastructureReconciler", "Created: " + names);
    }

    result.bundle.add_all(executor_.history_since(mark));
    return result;
}

SetupResult InfrastructureReconciler::ensure(bool restart) {
    if (restart) {
        logger_.info("InfrastructureReconciler", "Forced setup of all components");
        return setup(all_infrastructure_components());
    }
    InfrastructureReport report = check_existing();
    if (report.all_satisfied) {
        return SetupResult();
    }
    return setup(report.missing);
}

} // namespace netpilot

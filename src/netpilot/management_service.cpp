#include "netpilot/management_service.hpp"
#include "netpilot/errors.hpp"

#include <sstream>

namespace netpilot {

namespace {

std::optional<int> parse_group_id(const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size() || value < 0) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string error_reply(const PilotError& e) {
    return "Error: " + error_kind_to_string(e.kind()) + ": " + e.what();
}

} // namespace

ManagementService::ManagementService(PilotLogger& logger, ManagementInterface& mi, ModeActivationEngine& engine,
                                     InfrastructureReconciler& reconciler, RemoteStateStore& store,
                                     GroupSyncService& sync)
    : logger_(logger), management_interface_(mi), engine_(engine), reconciler_(reconciler), store_(store),
      sync_(sync) {}

std::optional<DeviceRef> ManagementService::parse_device_token(const std::string& token) {
    auto comma = token.find(',');
    if (comma == std::string::npos || comma == 0 || comma + 1 == token.size()) {
        return std::nullopt;
    }
    return DeviceRef{token.substr(0, comma), token.substr(comma + 1)};
}

std::string ManagementService::format_bundle(const RouterCommandBundle& bundle) {
    std::ostringstream oss;
    if (bundle.dry_run) {
        oss << "Dry run, nothing executed.\n";
    }
    auto section = [&oss](const char* title, const std::vector<std::string>& lines) {
        if (lines.empty()) return;
        oss << title << ":\n";
        for (const auto& line : lines) {
            oss << "  " << line << "\n";
        }
    };
    section("Traffic shaping", bundle.tc_commands);
    section("Rule chains", bundle.iptables_commands);
    section("Cleanup", bundle.cleanup_commands);
    section("Warnings", bundle.warnings);
    oss << bundle.command_count() << " commands";
    if (bundle.requires_restart) {
        oss << ", scaffolding was (re)created";
    }
    return oss.str();
}

std::string ManagementService::format_group(const PolicyGroup& group) {
    std::ostringstream oss;
    oss << "Group " << group.group_id << " (" << group.name << ")" << (group.active ? "" : " inactive") << "\n";
    oss << "  Limit: ";
    if (group.bandwidth.limit_mbps) {
        oss << *group.bandwidth.limit_mbps << " Mbit/s";
    } else {
        oss << "none";
    }
    if (group.bandwidth.allocation) {
        oss << ", class " << group.bandwidth.allocation->tc_class_id << " mark " << group.bandwidth.allocation->mark_value;
    }
    oss << "\n";
    oss << "  Devices (" << group.devices.size() << "):\n";
    for (const auto& d : group.devices) {
        oss << "    " << d.ip << " " << d.mac << "\n";
    }
    if (!group.time_based.empty()) {
        oss << "  Schedules: " << group.time_based.size() << "\n";
    }
    oss << "  Last sync: " << group.last_sync.value_or("never");
    return oss.str();
}

std::string ManagementService::format_report(const InfrastructureReport& report) {
    std::ostringstream oss;
    for (InfrastructureComponent component : all_infrastructure_components()) {
        auto it = report.details.find(component);
        oss << component_to_string(component) << ": " << (it != report.details.end() ? it->second : "unchecked")
            << "\n";
    }
    oss << (report.all_satisfied ? "All components present"
                                 : std::to_string(report.missing.size()) + " components missing");
    return oss.str();
}

std::string ManagementService::format_verification(const DeviceVerificationResult& result) {
    std::ostringstream oss;
    if (!result.is_valid) {
        oss << "Invalid: " << (result.error_kind ? error_kind_to_string(*result.error_kind) : "unknown") << ": "
            << result.error_message;
        return oss.str();
    }
    const DeviceDelta& delta = result.delta;
    oss << "Valid" << (result.group_exists ? "" : " (new group)") << "\n";
    for (const auto& d : delta.added) oss << "  + " << d.to_string() << "\n";
    for (const auto& d : delta.removed) oss << "  - " << d.to_string() << "\n";
    for (const auto& c : delta.ip_changed) oss << "  ip  " << c.first.to_string() << " -> " << c.second.to_string() << "\n";
    for (const auto& c : delta.mac_changed) oss << "  mac " << c.first.to_string() << " -> " << c.second.to_string() << "\n";
    oss << "  " << delta.unchanged.size() << " unchanged";
    return oss.str();
}

std::string ManagementService::handle_mode_command(const std::string& verb, const std::vector<std::string>& args) {
    try {
        if (verb == "show") {
            return "Active mode: " + active_mode_to_string(engine_.get_active_mode());
        }
        if (verb == "validate") {
            ModeValidation validation = engine_.validate_mode();
            std::ostringstream oss;
            oss << "Mode: " << active_mode_to_string(validation.mode) << "\n";
            for (const auto& pair : validation.attachments) {
                oss << "  " << pair.first << ":";
                for (const auto& chain : pair.second) oss << " " << chain;
                oss << "\n";
            }
            for (const auto& problem : validation.problems) oss << "  problem: " << problem << "\n";
            oss << (validation.consistent ? "Consistent" : "Inconsistent");
            return oss.str();
        }
        if (verb == "off") {
            return format_bundle(engine_.deactivate());
        }
        if (verb == "allow" || verb == "deny") {
            if (args.size() != 1) return "Error: Usage: mode " + verb + " <group_id>";
            auto group_id = parse_group_id(args[0]);
            if (!group_id) return "Error: Invalid group id: " + args[0];
            return format_bundle(verb == "allow" ? engine_.activate_allow_list(*group_id)
                                                 : engine_.activate_deny_list(*group_id));
        }
        if (verb == "add" || verb == "remove") {
            if (args.size() != 1) return "Error: Usage: mode " + verb + " <ip>,<mac>";
            auto device = parse_device_token(args[0]);
            if (!device) return "Error: Invalid device: " + args[0];
            return format_bundle(verb == "add" ? engine_.add_device_to_active_list(*device)
                                               : engine_.remove_device_from_active_list(*device));
        }
    } catch (const PilotError& e) {
        logger_.error("ManagementService", std::string("mode ") + verb + " failed: " + e.what());
        return error_reply(e);
    }
    return "Error: Unknown mode command: " + verb;
}

std::string ManagementService::handle_infra_command(const std::string& verb, const std::vector<std::string>& args) {
    try {
        if (verb == "check") {
            return format_report(reconciler_.check_existing());
        }
        if (verb == "setup") {
            bool restart = !args.empty() && args[0] == "restart";
            if (!args.empty() && !restart) return "Error: Usage: infra setup [restart]";
            SetupResult result = reconciler_.ensure(restart);
            std::ostringstream oss;
            oss << "Created:";
            if (result.created.empty()) oss << " nothing";
            for (auto component : result.created) oss << " " << component_to_string(component);
            oss << "\n" << format_bundle(result.bundle);
            return oss.str();
        }
    } catch (const PilotError& e) {
        logger_.error("ManagementService", std::string("infra ") + verb + " failed: " + e.what());
        return error_reply(e);
    }
    return "Error: Unknown infra command: " + verb;
}

// group sync <id> [name <name>] [limit <mbps>|none] [device <ip>,<mac>]... [force] [dry-run]
std::string ManagementService::handle_group_sync(const std::vector<std::string>& args) {
    if (args.empty()) return "Error: Usage: group sync <group_id> [name <n>] [limit <mbps>|none] [device <ip>,<mac>]... [force] [dry-run]";
    auto group_id = parse_group_id(args[0]);
    if (!group_id) return "Error: Invalid group id: " + args[0];

    GroupSyncRequest request;
    request.group_id = *group_id;
    std::optional<PolicyGroup> current;
    try {
        current = store_.get_group(*group_id);
    } catch (const PilotError& e) {
        return error_reply(e);
    }
    if (current) {
        // Unspecified fields keep their stored values.
        request.name = current->name;
        request.bandwidth_limit_mbps = current->bandwidth.limit_mbps;
        request.access_control = current->access_control;
        request.time_based = current->time_based;
        request.active = current->active;
        for (const auto& d : current->devices) {
            request.device_ips.push_back(d.ip);
            request.device_macs.push_back(d.mac);
        }
    }

    bool devices_given = false;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& word = args[i];
        if (word == "force") {
            request.force_sync = true;
        } else if (word == "dry-run") {
            request.dry_run = true;
        } else if (word == "inactive") {
            request.active = false;
        } else if (word == "name" && i + 1 < args.size()) {
            request.name = args[++i];
        } else if (word == "limit" && i + 1 < args.size()) {
            const std::string& value = args[++i];
            if (value == "none") {
                request.bandwidth_limit_mbps.reset();
            } else {
                try {
                    request.bandwidth_limit_mbps = static_cast<uint32_t>(std::stoul(value));
                } catch (const std::exception&) {
                    return "Error: Invalid limit: " + value;
                }
            }
        } else if (word == "device" && i + 1 < args.size()) {
            auto device = parse_device_token(args[++i]);
            if (!device) return "Error: Invalid device: " + args[i];
            if (!devices_given) {
                request.device_ips.clear();
                request.device_macs.clear();
                devices_given = true;
            }
            request.device_ips.push_back(device->ip);
            request.device_macs.push_back(device->mac);
        } else if (word == "no-devices") {
            request.device_ips.clear();
            request.device_macs.clear();
            devices_given = true;
        } else {
            return "Error: Unexpected argument: " + word;
        }
    }

    try {
        return format_bundle(sync_.sync_group(request));
    } catch (const PilotError& e) {
        logger_.error("ManagementService", "group sync " + args[0] + " failed: " + e.what());
        return error_reply(e);
    }
}

std::string ManagementService::handle_group_delete(const std::vector<std::string>& args) {
    if (args.size() != 1) return "Error: Usage: group delete <group_id>";
    auto group_id = parse_group_id(args[0]);
    if (!group_id) return "Error: Invalid group id: " + args[0];
    try {
        return format_bundle(sync_.remove_group(*group_id));
    } catch (const PilotError& e) {
        return error_reply(e);
    }
}

std::string ManagementService::handle_group_show(const std::vector<std::string>& args) {
    try {
        if (args.empty()) {
            std::ostringstream oss;
            std::vector<PolicyGroup> groups = store_.list_groups();
            for (size_t i = 0; i < groups.size(); ++i) {
                if (i > 0) oss << "\n";
                oss << format_group(groups[i]);
            }
            return oss.str();
        }
        auto group_id = parse_group_id(args[0]);
        if (!group_id) return "Error: Invalid group id: " + args[0];
        std::optional<PolicyGroup> group = store_.get_group(*group_id);
        if (!group) return "Error: Group " + args[0] + " not found.";
        return format_group(*group);
    } catch (const PilotError& e) {
        return error_reply(e);
    }
}

std::string ManagementService::handle_group_verify(const std::vector<std::string>& args) {
    if (args.empty()) return "Error: Usage: group verify <group_id> <ip>,<mac>...";
    auto group_id = parse_group_id(args[0]);
    if (!group_id) return "Error: Invalid group id: " + args[0];
    std::vector<std::string> ips;
    std::vector<std::string> macs;
    for (size_t i = 1; i < args.size(); ++i) {
        auto device = parse_device_token(args[i]);
        if (!device) return "Error: Invalid device: " + args[i];
        ips.push_back(device->ip);
        macs.push_back(device->mac);
    }
    try {
        return format_verification(store_.verify_devices(*group_id, ips, macs));
    } catch (const PilotError& e) {
        return error_reply(e);
    }
}

std::string ManagementService::handle_rates_set(const std::vector<std::string>& args) {
    if (args.size() != 2) return "Error: Usage: rates set <unrestricted> <limited>";
    try {
        return format_bundle(engine_.update_rates(args[0], args[1]));
    } catch (const PilotError& e) {
        return error_reply(e);
    }
}

void ManagementService::register_cli_commands() {
    management_interface_.register_command({"mode", "show"},
        [this](const std::vector<std::string>& args) { return this->handle_mode_command("show", args); },
        "mode show");
    management_interface_.register_command({"mode", "validate"},
        [this](const std::vector<std::string>& args) { return this->handle_mode_command("validate", args); },
        "mode validate");
    management_interface_.register_command({"mode", "allow"},
        [this](const std::vector<std::string>& args) { return this->handle_mode_command("allow", args); },
        "mode allow <group_id>");
    management_interface_.register_command({"mode", "deny"},
        [this](const std::vector<std::string>& args) { return this->handle_mode_command("deny", args); },
        "mode deny <group_id>");
    management_interface_.register_command({"mode", "off"},
        [this](const std::vector<std::string>& args) { return this->handle_mode_command("off", args); },
        "mode off");
    management_interface_.register_command({"mode", "add"},
        [this](const std::vector<std::string>& args) { return this->handle_mode_command("add", args); },
        "mode add <ip>,<mac>");
    management_interface_.register_command({"mode", "remove"},
        [this](const std::vector<std::string>& args) { return this->handle_mode_command("remove", args); },
        "mode remove <ip>,<mac>");

    management_interface_.register_command({"infra", "check"},
        [this](const std::vector<std::string>& args) { return this->handle_infra_command("check", args); },
        "infra check");
    management_interface_.register_command({"infra", "setup"},
        [this](const std::vector<std::string>& args) { return this->handle_infra_command("setup", args); },
        "infra setup [restart]");

    management_interface_.register_command({"group", "sync"},
        [this](const std::vector<std::string>& args) { return this->handle_group_sync(args); },
        "group sync <group_id> [name <n>] [limit <mbps>|none] [device <ip>,<mac>]... [no-devices] [inactive] [force] [dry-run]");
    management_interface_.register_command({"group", "delete"},
        [this](const std::vector<std::string>& args) { return this->handle_group_delete(args); },
        "group delete <group_id>");
    management_interface_.register_command({"group", "show"},
        [this](const std::vector<std::string>& args) { return this->handle_group_show(args); },
        "group show [<group_id>]");
    management_interface_.register_command({"group", "verify"},
        [this](const std::vector<std::string>& args) { return this->handle_group_verify(args); },
        "group verify <group_id> <ip>,<mac>...");

    management_interface_.register_command({"rates", "set"},
        [this](const std::vector<std::string>& args) { return this->handle_rates_set(args); },
        "rates set <unrestricted> <limited>");

    management_interface_.register_command({"help"},
        [this](const std::vector<std::string>&) {
            return "Available commands:\n" + management_interface_.help_text();
        });

    logger_.debug("ManagementService", "CLI commands registered");
}

} // namespace netpilot

#include "netpilot/config_manager.hpp"
#include "netpilot/errors.hpp"
#include "netpilot/firewall_layout.hpp"

#include <cctype>
#include <set>

namespace netpilot {

namespace {

const std::set<std::string> kDurationKeys = {
    "pool.connection_idle_seconds",
    "pool.session_idle_seconds",
    "pool.reaper_interval_seconds",
    "pool.connect_timeout_seconds",
    "command.timeout_seconds",
};

const std::set<std::string> kUnsignedKeys = {
    "classes.first_id",
    "classes.max_id",
    "classes.reserved_id",
    "marks.unrestricted",
    "marks.limited",
};

const std::set<std::string> kIdentifierKeys = {
    "firewall.table",
    "firewall.allow_chain",
    "firewall.deny_chain",
    "firewall.groups_chain",
    "firewall.hook",
};

// Chain, table and hook names end up unquoted on a remote shell line.
bool is_shell_safe_identifier(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') return false;
    }
    return true;
}

} // namespace

std::vector<std::string> ConfigManager::validate_config(const ConfigurationData& config_to_validate) const {
    std::vector<std::string> errors;

    auto as_unsigned = [](const ConfigValue& v) -> std::optional<uint64_t> {
        if (auto* p = std::get_if<uint32_t>(&v)) return *p;
        if (auto* p = std::get_if<uint64_t>(&v)) return *p;
        if (auto* p = std::get_if<int>(&v)) {
            if (*p >= 0) return static_cast<uint64_t>(*p);
        }
        return std::nullopt;
    };

    for (const auto& pair : config_to_validate) {
        const std::string& key = pair.first;
        const ConfigValue& value = pair.second;

        if (key.empty()) {
            errors.push_back("Configuration key cannot be empty.");
            continue;
        }

        if (kDurationKeys.count(key)) {
            auto v = as_unsigned(value);
            if (!v || *v == 0) {
                errors.push_back("Invalid value for '" + key + "'. Expected a positive number of seconds.");
            }
        } else if (kUnsignedKeys.count(key)) {
            if (!as_unsigned(value)) {
                errors.push_back("Invalid value for '" + key + "'. Expected a non-negative integer.");
            }
        } else if (kIdentifierKeys.count(key)) {
            auto* s = std::get_if<std::string>(&value);
            if (!s || !is_shell_safe_identifier(*s)) {
                errors.push_back("Invalid value for '" + key + "'. Expected a name of letters, digits, '_' or '-'.");
            }
        } else if (key == "rates.unrestricted" || key == "rates.limited") {
            if (!is_valid_rate(value_to_string(value))) {
                errors.push_back("Invalid rate for '" + key + "'. Expected e.g. '50mbit'.");
            }
        } else if (key.rfind("device.", 0) == 0 && key.size() > 5 && key.compare(key.size() - 5, 5, ".port") == 0) {
            auto v = as_unsigned(value);
            if (!v || *v == 0 || *v > 65535) {
                errors.push_back("Invalid port for '" + key + "'. Expected 1-65535.");
            }
        }
    }

    auto first = config_to_validate.find("classes.first_id");
    auto max = config_to_validate.find("classes.max_id");
    uint64_t first_id = first != config_to_validate.end() ? as_unsigned(first->second).value_or(0) : 101;
    uint64_t max_id = max != config_to_validate.end() ? as_unsigned(max->second).value_or(0) : 999;
    if (first_id >= max_id) {
        errors.push_back("classes.first_id (" + std::to_string(first_id) + ") must be below classes.max_id (" +
                         std::to_string(max_id) + ").");
    }

    if (logger_) {
        if (!errors.empty()) {
            logger_->warning("ConfigManager", "Configuration validation found " + std::to_string(errors.size()) + " errors.");
        } else {
            logger_->debug("ConfigManager", "Configuration validation successful.");
        }
    }
    return errors;
}

PilotSettings load_settings(const ConfigManager& config) {
    std::vector<std::string> errors = config.validate_config(config.get_current_config_data());
    if (!errors.empty()) {
        std::string joined;
        for (const auto& e : errors) {
            if (!joined.empty()) joined += " ";
            joined += e;
        }
        throw ConfigurationError(joined);
    }

    PilotSettings s;
    auto seconds = [&](const std::string& key, std::chrono::seconds fallback) {
        auto v = config.get_unsigned(key);
        return v ? std::chrono::seconds(static_cast<long long>(*v)) : fallback;
    };
    auto u32 = [&](const std::string& key, uint32_t fallback) {
        auto v = config.get_unsigned(key);
        return v ? static_cast<uint32_t>(*v) : fallback;
    };
    auto str = [&](const std::string& key, const std::string& fallback) {
        return config.get_string(key).value_or(fallback);
    };

    s.connection_idle = seconds("pool.connection_idle_seconds", s.connection_idle);
    s.session_idle = seconds("pool.session_idle_seconds", s.session_idle);
    s.reaper_interval = seconds("pool.reaper_interval_seconds", s.reaper_interval);
    s.connect_timeout = seconds("pool.connect_timeout_seconds", s.connect_timeout);
    s.command_timeout = seconds("command.timeout_seconds", s.command_timeout);

    s.state_file_path = str("state.file_path", s.state_file_path);
    s.first_class_id = u32("classes.first_id", s.first_class_id);
    s.max_class_id = u32("classes.max_id", s.max_class_id);
    s.reserved_class_id = u32("classes.reserved_id", s.reserved_class_id);

    s.unrestricted_rate = str("rates.unrestricted", s.unrestricted_rate);
    s.limited_rate = str("rates.limited", s.limited_rate);
    s.unrestricted_mark = u32("marks.unrestricted", s.unrestricted_mark);
    s.limited_mark = u32("marks.limited", s.limited_mark);

    s.firewall_table = str("firewall.table", s.firewall_table);
    s.allow_chain = str("firewall.allow_chain", s.allow_chain);
    s.deny_chain = str("firewall.deny_chain", s.deny_chain);
    s.groups_chain = str("firewall.groups_chain", s.groups_chain);
    s.activation_hook = str("firewall.hook", s.activation_hook);

    s.ssh_binary = str("ssh.binary", s.ssh_binary);
    s.ssh_control_dir = str("ssh.control_dir", s.ssh_control_dir);
    return s;
}

} // namespace netpilot

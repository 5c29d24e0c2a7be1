#ifndef NETPILOT_CONFIG_MANAGER_HPP
#define NETPILOT_CONFIG_MANAGER_HPP

#include "netpilot/logger.hpp"

#include <cstdint> // For uint32_t, uint64_t
#include <string>
#include <vector>
#include <map>
#include <variant>
#include <optional>
#include <chrono>
#include <charconv>  // For std::from_chars
#include <fstream>   // For std::ifstream, std::ofstream
#include <sstream>   // For std::stringstream
#include <algorithm> // For std::transform for case-insensitive string comparison
#include <limits>    // For std::numeric_limits

namespace netpilot {

// Define supported configuration value types
using ConfigValue = std::variant<
    bool,
    int,
    uint32_t,
    uint64_t,
    double,
    std::string
>;

// Configuration data is stored as a map of dotted keys to ConfigValue
using ConfigurationData = std::map<std::string, ConfigValue>;

class ConfigManager {
public:
    ConfigManager() = default;

    // Parses "key = value" lines; '#' starts a comment line.
    bool load_config(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            if (logger_) logger_->error("ConfigManager", "Failed to open config file: " + filename);
            return false;
        }

        config_data_.clear();
        std::string line;
        int line_num = 0;
        while (std::getline(file, line)) {
            line_num++;
            line.erase(0, line.find_first_not_of(" \t\n\r\f\v"));
            line.erase(line.find_last_not_of(" \t\n\r\f\v") + 1);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            size_t delimiter_pos = line.find('=');
            if (delimiter_pos == std::string::npos) {
                if (logger_) logger_->warning("ConfigManager", "Skipping malformed line (no '=') in " + filename + " at line " + std::to_string(line_num));
                continue;
            }

            std::string key = line.substr(0, delimiter_pos);
            std::string value_str = line.substr(delimiter_pos + 1);

            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t") + 1);
            value_str.erase(0, value_str.find_first_not_of(" \t"));
            value_str.erase(value_str.find_last_not_of(" \t") + 1);

            if (key.empty()) {
                if (logger_) logger_->warning("ConfigManager", "Skipping line with empty key in " + filename + " at line " + std::to_string(line_num));
                continue;
            }

            config_data_[key] = parse_value(value_str);
        }

        loaded_config_filename_ = filename;
        if (logger_) logger_->info("ConfigManager", "Loaded " + std::to_string(config_data_.size()) + " settings from " + filename);
        return true;
    }

    bool save_config(const std::string& filename_param = "") const {
        const std::string& target_filename = filename_param.empty() ? loaded_config_filename_ : filename_param;
        if (target_filename.empty()) {
            if (logger_) logger_->error("ConfigManager", "Save failed: No filename specified and no config previously loaded.");
            return false;
        }

        std::ofstream file(target_filename);
        if (!file.is_open()) {
            if (logger_) logger_->error("ConfigManager", "Failed to open file for saving: " + target_filename);
            return false;
        }

        for (const auto& pair : config_data_) {
            file << pair.first << "=" << value_to_string(pair.second) << "\n";
        }
        return true;
    }

    std::optional<ConfigValue> get_parameter(const std::string& path) const {
        auto it = config_data_.find(path);
        if (it != config_data_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    template<typename T>
    std::optional<T> get_parameter_as(const std::string& path) const {
        std::optional<ConfigValue> opt_val = get_parameter(path);
        if (opt_val.has_value() && std::holds_alternative<T>(opt_val.value())) {
            return std::get<T>(opt_val.value());
        }
        return std::nullopt;
    }

    // Any non-negative integral alternative, widened.
    std::optional<uint64_t> get_unsigned(const std::string& path) const {
        std::optional<ConfigValue> opt_val = get_parameter(path);
        if (!opt_val) return std::nullopt;
        if (auto* v = std::get_if<uint32_t>(&opt_val.value())) return *v;
        if (auto* v = std::get_if<uint64_t>(&opt_val.value())) return *v;
        if (auto* v = std::get_if<int>(&opt_val.value())) {
            if (*v >= 0) return static_cast<uint64_t>(*v);
        }
        return std::nullopt;
    }

    // Strings are returned as-is; numbers are rendered back to text.
    std::optional<std::string> get_string(const std::string& path) const {
        std::optional<ConfigValue> opt_val = get_parameter(path);
        if (!opt_val) return std::nullopt;
        return value_to_string(opt_val.value());
    }

    void set_parameter(const std::string& path, ConfigValue value) {
        config_data_[path] = value;
    }

    const ConfigurationData& get_current_config_data() const {
        return config_data_;
    }

    // All keys below "<prefix>." with the prefix removed.
    std::map<std::string, ConfigValue> get_section(const std::string& prefix) const {
        std::map<std::string, ConfigValue> section;
        const std::string dotted = prefix + ".";
        for (auto it = config_data_.lower_bound(dotted); it != config_data_.end(); ++it) {
            if (it->first.compare(0, dotted.size(), dotted) != 0) break;
            section[it->first.substr(dotted.size())] = it->second;
        }
        return section;
    }

    void set_logger(PilotLogger* logger) {
        logger_ = logger;
    }

    std::vector<std::string> validate_config(const ConfigurationData& config_to_validate) const;

    static std::string value_to_string(const ConfigValue& value) {
        std::string value_str;
        std::visit([&](const auto& val) {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, bool>) {
                value_str = val ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                value_str = val;
            } else {
                value_str = std::to_string(val);
            }
        }, value);
        return value_str;
    }

private:
    static ConfigValue parse_value(const std::string& value_str) {
        std::string lower_value_str = value_str;
        std::transform(lower_value_str.begin(), lower_value_str.end(), lower_value_str.begin(), ::tolower);

        if (lower_value_str == "true") return true;
        if (lower_value_str == "false") return false;

        int int_val;
        auto [ptr, ec] = std::from_chars(value_str.data(), value_str.data() + value_str.size(), int_val);
        if (ec == std::errc() && ptr == value_str.data() + value_str.size()) {
            return int_val;
        }

        uint64_t uint64_val;
        auto [ptr_u64, ec_u64] = std::from_chars(value_str.data(), value_str.data() + value_str.size(), uint64_val);
        if (ec_u64 == std::errc() && ptr_u64 == value_str.data() + value_str.size()) {
            if (uint64_val <= std::numeric_limits<uint32_t>::max()) {
                return static_cast<uint32_t>(uint64_val);
            }
            return uint64_val;
        }

        // Rates such as "50mbit" stay strings; only a fully consumed number is a double.
        double double_val;
        std::stringstream ss_double(value_str);
        ss_double >> double_val;
        if (!value_str.empty() && !ss_double.fail() && ss_double.eof()) {
            return double_val;
        }
        return value_str;
    }

    ConfigurationData config_data_;
    std::string loaded_config_filename_;
    PilotLogger* logger_ = nullptr;
};

// Typed view of the settings every component reads at construction.
struct PilotSettings {
    // Connection pool
    std::chrono::seconds connection_idle{300};
    std::chrono::seconds session_idle{1800};
    std::chrono::seconds reaper_interval{30};
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds command_timeout{30};

    // Remote state document
    std::string state_file_path = "/etc/config/netpilot_groups_state.json";
    uint32_t first_class_id = 101;
    uint32_t max_class_id = 999;      // exclusive ceiling
    uint32_t reserved_class_id = 100; // group 0

    // Traffic shaping
    std::string unrestricted_rate = "1000mbit";
    std::string limited_rate = "50mbit";
    uint32_t unrestricted_mark = 1;
    uint32_t limited_mark = 98;

    // Firewall layout
    std::string firewall_table = "mangle";
    std::string allow_chain = "NETPILOT_WHITELIST";
    std::string deny_chain = "NETPILOT_BLACKLIST";
    std::string groups_chain = "NETPILOT_GROUPS";
    std::string activation_hook = "FORWARD";

    // OpenSSH transport
    std::string ssh_binary = "ssh";
    std::string ssh_control_dir = "/tmp";
};

// Throws ConfigurationError when validate_config() reports problems.
PilotSettings load_settings(const ConfigManager& config);

} // namespace netpilot

#endif // NETPILOT_CONFIG_MANAGER_HPP

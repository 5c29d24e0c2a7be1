#ifndef NETPILOT_MANAGEMENT_INTERFACE_HPP
#define NETPILOT_MANAGEMENT_INTERFACE_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace netpilot {

// Word-prefix command registry. The longest registered prefix of the input
// wins and its handler receives the remaining words.
class ManagementInterface {
public:
    ManagementInterface() = default;

    using CliHandler = std::function<std::string(const std::vector<std::string>& args)>;

    void register_command(const std::vector<std::string>& command_parts, CliHandler handler,
                          const std::string& usage = "") {
        if (command_parts.empty()) return;
        cli_commands_[command_parts] = std::move(handler);
        if (!usage.empty()) {
            usage_[command_parts] = usage;
        }
    }

    std::string handle_cli_command(const std::string& command_line) const {
        std::vector<std::string> input_parts;
        std::string current_part;
        std::istringstream iss(command_line);
        while (iss >> current_part) {
            input_parts.push_back(current_part);
        }
        return handle_cli_command(input_parts);
    }

    std::string handle_cli_command(const std::vector<std::string>& input_parts) const {
        if (input_parts.empty()) {
            return "Error: Empty command.";
        }

        std::vector<std::string> best_match_command_key;
        const CliHandler* best_handler = nullptr;

        for (auto const& [registered_command_key, handler_func] : cli_commands_) {
            if (input_parts.size() < registered_command_key.size()) continue;
            bool prefix_match = true;
            for (std::size_t i = 0; i < registered_command_key.size(); ++i) {
                if (input_parts[i] != registered_command_key[i]) {
                    prefix_match = false;
                    break;
                }
            }
            if (prefix_match &&
                (best_handler == nullptr || registered_command_key.size() > best_match_command_key.size())) {
                best_match_command_key = registered_command_key;
                best_handler = &handler_func;
            }
        }

        if (best_handler) {
            std::vector<std::string> args(input_parts.begin() + best_match_command_key.size(), input_parts.end());
            return (*best_handler)(args);
        }

        std::string joined;
        for (const auto& part : input_parts) {
            if (!joined.empty()) joined += ' ';
            joined += part;
        }
        return "Error: Unknown command: " + joined + ". Type 'help' for available commands.";
    }

    std::string help_text() const {
        std::ostringstream oss;
        for (const auto& pair : usage_) {
            oss << "  " << pair.second << "\n";
        }
        return oss.str();
    }

private:
    std::map<std::vector<std::string>, CliHandler> cli_commands_;
    std::map<std::vector<std::string>, std::string> usage_;
};

} // namespace netpilot

#endif // NETPILOT_MANAGEMENT_INTERFACE_HPP

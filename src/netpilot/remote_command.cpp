#include "netpilot/remote_command.hpp"

#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace netpilot {

std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::ENSURE_STATE: return "ensure_state";
        case Phase::TEARDOWN:     return "teardown";
        case Phase::REBUILD:      return "rebuild";
        case Phase::ACTIVATE:     return "activate";
        case Phase::APPLY_RATES:  return "apply_rates";
        default:                  return "unknown";
    }
}

std::string category_to_string(CommandCategory category) {
    switch (category) {
        case CommandCategory::TRAFFIC_SHAPING: return "traffic_shaping";
        case CommandCategory::RULE_CHAIN:      return "rule_chain";
        case CommandCategory::STATE:           return "state";
        case CommandCategory::INSPECT:         return "inspect";
        case CommandCategory::CLEANUP:         return "cleanup";
        default:                               return "unknown";
    }
}

std::string shell_quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

namespace {

std::string iptables_prefix(const std::string& table) {
    return "iptables -t " + table;
}

std::string rule_head(RuleAction action, const std::string& table, const std::string& chain, uint32_t position) {
    std::ostringstream oss;
    oss << iptables_prefix(table);
    switch (action) {
        case RuleAction::APPEND:
            oss << " -A " << chain;
            break;
        case RuleAction::INSERT:
            oss << " -I " << chain;
            if (position > 0) oss << " " << position;
            break;
        case RuleAction::DELETE:
            oss << " -D " << chain;
            break;
    }
    return oss.str();
}

std::string match_clause(MatchKind match, const std::string& value) {
    switch (match) {
        case MatchKind::MAC_SOURCE:     return " -m mac --mac-source " + value;
        case MatchKind::IP_DESTINATION: return " -d " + value;
        case MatchKind::ANY:
        default:                        return "";
    }
}

struct Renderer {
    std::string operator()(const ops::CreateChain& c) const {
        return iptables_prefix(c.table) + " -N " + c.chain;
    }
    std::string operator()(const ops::FlushChain& c) const {
        return iptables_prefix(c.table) + " -F " + c.chain;
    }
    std::string operator()(const ops::AttachChain& c) const {
        return iptables_prefix(c.table) + " -A " + c.hook + " -j " + c.chain;
    }
    std::string operator()(const ops::DetachChain& c) const {
        return iptables_prefix(c.table) + " -D " + c.hook + " -j " + c.chain;
    }
    std::string operator()(const ops::ListChain& c) const {
        return iptables_prefix(c.table) + " -L " + c.chain + " -n";
    }
    std::string operator()(const ops::MarkRule& r) const {
        return rule_head(r.action, r.table, r.chain, r.position) + match_clause(r.match, r.value) +
               " -j MARK --set-mark " + std::to_string(r.mark);
    }
    std::string operator()(const ops::ReturnRule& r) const {
        return rule_head(r.action, r.table, r.chain, r.position) + match_clause(r.match, r.value) + " -j RETURN";
    }
    std::string operator()(const ops::AddRootQdisc& q) const {
        return "tc qdisc add dev " + q.interface + " root handle 1: htb default " + q.default_class_minor;
    }
    std::string operator()(const ops::DeleteRootQdisc& q) const {
        return "tc qdisc del dev " + q.interface + " root";
    }
    std::string operator()(const ops::ShapingClass& c) const {
        switch (c.action) {
            case ops::ClassAction::ADD:
                return "tc class add dev " + c.interface + " parent 1: classid " + c.class_id + " htb rate " + c.rate;
            case ops::ClassAction::CHANGE:
                return "tc class change dev " + c.interface + " parent 1: classid " + c.class_id + " htb rate " + c.rate;
            case ops::ClassAction::DELETE:
            default:
                return "tc class del dev " + c.interface + " classid " + c.class_id;
        }
    }
    std::string operator()(const ops::MarkFilter& f) const {
        std::string head = f.remove ? "tc filter del dev " : "tc filter add dev ";
        std::string text = head + f.interface + " parent 1: protocol ip prio " + std::to_string(f.priority) +
                           " handle " + std::to_string(f.mark) + " fw";
        if (!f.remove) {
            text += " flowid " + f.flow_id;
        }
        return text;
    }
    std::string operator()(const ops::ShowClasses& s) const {
        return "tc class show dev " + s.interface;
    }
    std::string operator()(const ops::ReadFile& r) const {
        return "cat " + shell_quote(r.path);
    }
    std::string operator()(const ops::WriteFile& w) const {
        const std::string tmp = shell_quote(w.path + ".tmp");
        return "cat > " + tmp + " && mv " + tmp + " " + shell_quote(w.path) + " && echo " +
               ops::WriteFile::kConfirmation;
    }
    std::string operator()(const ops::FileExists& p) const {
        return "[ -f " + shell_quote(p.path) + " ] && echo exists || echo missing";
    }
    std::string operator()(const ops::ListInterfaces&) const {
        return "ls /sys/class/net";
    }
    std::string operator()(const ops::DropNftTable& d) const {
        return "nft delete table " + d.family + " " + d.table;
    }
};

} // namespace

std::string render(const RemoteCommand& command) {
    return std::visit(Renderer{}, command);
}

std::string stdin_payload(const RemoteCommand& command) {
    if (const auto* write = std::get_if<ops::WriteFile>(&command)) {
        return write->content;
    }
    return std::string();
}

CommandCategory category_of(const RemoteCommand& command) {
    return std::visit([](const auto& op) -> CommandCategory {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, ops::ShapingClass>) {
            return op.action == ops::ClassAction::DELETE ? CommandCategory::CLEANUP : CommandCategory::TRAFFIC_SHAPING;
        } else if constexpr (std::is_same_v<T, ops::MarkFilter>) {
            return op.remove ? CommandCategory::CLEANUP : CommandCategory::TRAFFIC_SHAPING;
        } else if constexpr (std::is_same_v<T, ops::AddRootQdisc>) {
            return CommandCategory::TRAFFIC_SHAPING;
        } else if constexpr (std::is_same_v<T, ops::ReadFile> ||
                             std::is_same_v<T, ops::WriteFile>) {
            return CommandCategory::STATE;
        } else if constexpr (std::is_same_v<T, ops::ListChain> ||
                             std::is_same_v<T, ops::ShowClasses> ||
                             std::is_same_v<T, ops::FileExists> ||
                             std::is_same_v<T, ops::ListInterfaces>) {
            return CommandCategory::INSPECT;
        } else if constexpr (std::is_same_v<T, ops::DeleteRootQdisc> ||
                             std::is_same_v<T, ops::DropNftTable>) {
            return CommandCategory::CLEANUP;
        } else {
            return CommandCategory::RULE_CHAIN;
        }
    }, command);
}

CommandPlan& CommandPlan::add(Phase phase, RemoteCommand command) {
    if (!commands_.empty() && phase < commands_.back().phase) {
        throw std::logic_error("Command for phase '" + phase_to_string(phase) +
                               "' cannot follow phase '" + phase_to_string(commands_.back().phase) + "'");
    }
    commands_.push_back({phase, std::move(command)});
    return *this;
}

CommandPlan& CommandPlan::append(const CommandPlan& other) {
    for (const auto& planned : other.commands()) {
        add(planned.phase, planned.command);
    }
    return *this;
}

std::vector<std::string> CommandPlan::rendered(CommandCategory category) const {
    std::vector<std::string> out;
    for (const auto& planned : commands_) {
        if (category_of(planned.command) == category) {
            out.push_back(render(planned.command));
        }
    }
    return out;
}

std::vector<std::string> CommandPlan::rendered() const {
    std::vector<std::string> out;
    out.reserve(commands_.size());
    for (const auto& planned : commands_) {
        out.push_back(render(planned.command));
    }
    return out;
}

} // namespace netpilot

#ifndef NETPILOT_REMOTE_COMMAND_HPP
#define NETPILOT_REMOTE_COMMAND_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace netpilot {

enum class CommandCategory {
    TRAFFIC_SHAPING,
    RULE_CHAIN,
    STATE,
    INSPECT,
    CLEANUP
};

// Phases of a reconciliation run, in the order they must execute.
enum class Phase {
    ENSURE_STATE,
    TEARDOWN,
    REBUILD,
    ACTIVATE,
    APPLY_RATES
};

std::string phase_to_string(Phase phase);
std::string category_to_string(CommandCategory category);

// Wraps text in single quotes for a POSIX shell.
std::string shell_quote(const std::string& text);

// How a member rule selects packets.
enum class MatchKind {
    ANY,
    MAC_SOURCE,
    IP_DESTINATION
};

enum class RuleAction {
    APPEND,
    INSERT,
    DELETE
};

namespace ops {

struct CreateChain {
    std::string table;
    std::string chain;
};

struct FlushChain {
    std::string table;
    std::string chain;
};

struct AttachChain {
    std::string table;
    std::string hook;
    std::string chain;
};

struct DetachChain {
    std::string table;
    std::string hook;
    std::string chain;
};

struct ListChain {
    std::string table;
    std::string chain;
};

struct MarkRule {
    RuleAction action = RuleAction::APPEND;
    std::string table;
    std::string chain;
    uint32_t position = 0; // 1-based, INSERT only
    MatchKind match = MatchKind::ANY;
    std::string value;
    uint32_t mark = 0;
};

struct ReturnRule {
    RuleAction action = RuleAction::APPEND;
    std::string table;
    std::string chain;
    uint32_t position = 0;
    MatchKind match = MatchKind::ANY;
    std::string value;
};

struct AddRootQdisc {
    std::string interface;
    std::string default_class_minor = "1";
};

struct DeleteRootQdisc {
    std::string interface;
};

enum class ClassAction {
    ADD,
    CHANGE,
    DELETE
};

struct ShapingClass {
    ClassAction action = ClassAction::ADD;
    std::string interface;
    std::string class_id; // "1:10"
    std::string rate;     // "50mbit"; unused for DELETE
};

struct MarkFilter {
    bool remove = false;
    std::string interface;
    uint32_t priority = 1;
    uint32_t mark = 0;
    std::string flow_id; // unused for removal
};

struct ShowClasses {
    std::string interface;
};

struct ReadFile {
    std::string path;
};

// Streamed over stdin to "<path>.tmp" and renamed over the target; prints
// kConfirmation once the rename is done.
struct WriteFile {
    static constexpr const char* kConfirmation = "netpilot-write-ok";

    std::string path;
    std::string content;
};

struct FileExists {
    std::string path;
};

struct ListInterfaces {};

struct DropNftTable {
    std::string family;
    std::string table;
};

} // namespace ops

using RemoteCommand = std::variant<
    ops::CreateChain,
    ops::FlushChain,
    ops::AttachChain,
    ops::DetachChain,
    ops::ListChain,
    ops::MarkRule,
    ops::ReturnRule,
    ops::AddRootQdisc,
    ops::DeleteRootQdisc,
    ops::ShapingClass,
    ops::MarkFilter,
    ops::ShowClasses,
    ops::ReadFile,
    ops::WriteFile,
    ops::FileExists,
    ops::ListInterfaces,
    ops::DropNftTable
>;

// Shell text sent to the device.
std::string render(const RemoteCommand& command);
// Bytes fed to the command's stdin; empty for most commands.
std::string stdin_payload(const RemoteCommand& command);
CommandCategory category_of(const RemoteCommand& command);

struct PlannedCommand {
    Phase phase;
    RemoteCommand command;
};

// Ordered list of commands; a command may not be added under a phase that
// precedes the phase of the command before it.
class CommandPlan {
public:
    CommandPlan() = default;

    // Throws std::logic_error on a phase regression.
    CommandPlan& add(Phase phase, RemoteCommand command);
    CommandPlan& append(const CommandPlan& other);

    const std::vector<PlannedCommand>& commands() const { return commands_; }
    bool empty() const { return commands_.empty(); }
    std::size_t size() const { return commands_.size(); }

    std::vector<std::string> rendered(CommandCategory category) const;
    std::vector<std::string> rendered() const;

private:
    std::vector<PlannedCommand> commands_;
};

} // namespace netpilot

#endif // NETPILOT_REMOTE_COMMAND_HPP

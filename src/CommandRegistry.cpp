/**
 * CommandRegistry.cpp - Canonical commands, aliases and argument rules
 */

#include "ut/CommandRegistry.hpp"
#include "ut/CommandParser.hpp"
#include "ut/Handlers.hpp"
#include "ut/Result.hpp"

#include <algorithm>
#include <stdexcept>

namespace ut {

std::string CommandSpec::usage() const {
    return shape.empty() ? name : name + " " + shape;
}

void CommandSpec::checkArity(const std::vector<std::string>& args) const {
    if (args.size() < min_args) {
        throw ValidationError(name + ": missing argument. Usage: " + usage());
    }
    if (max_args != UNBOUNDED && args.size() > max_args) {
        throw ValidationError(name + ": too many arguments (" + std::to_string(args.size()) +
                              "). Usage: " + usage());
    }
}

CommandRegistry::CommandRegistry() = default;

CommandRegistry::~CommandRegistry() = default;

void CommandRegistry::add(CommandSpec spec) {
    if (spec.name.empty()) {
        throw std::logic_error("command registry: empty command name");
    }
    if (!spec.handler) {
        throw std::logic_error("command registry: '" + spec.name + "' has no handler");
    }
    if (spec.max_args < spec.min_args) {
        throw std::logic_error("command registry: '" + spec.name + "' has max_args < min_args");
    }

    std::vector<std::string> keys;
    keys.push_back(CommandParser::toLower(spec.name));
    for (const auto& alias : spec.aliases) {
        keys.push_back(CommandParser::toLower(alias));
    }

    for (size_t i = 0; i < keys.size(); ++i) {
        auto existing = index_.find(keys[i]);
        if (existing != index_.end()) {
            throw std::logic_error("command registry: '" + keys[i] + "' is already bound to '" +
                                   existing->second->name + "'");
        }
        if (std::find(keys.begin(), keys.begin() + i, keys[i]) != keys.begin() + i) {
            throw std::logic_error("command registry: '" + keys[i] + "' listed twice for '" +
                                   spec.name + "'");
        }
    }

    specs_.push_back(std::make_unique<CommandSpec>(std::move(spec)));
    const CommandSpec* stored = specs_.back().get();
    for (const auto& key : keys) {
        index_[key] = stored;
    }
}

const CommandSpec* CommandRegistry::lookup(const std::string& token) const {
    auto it = index_.find(CommandParser::toLower(token));
    if (it == index_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> CommandRegistry::canonicalNames() const {
    std::vector<std::string> names;
    for (const auto& spec : specs_) {
        names.push_back(spec->name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> CommandRegistry::allNames() const {
    std::vector<std::string> names;
    for (const auto& entry : index_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<const CommandSpec*> CommandRegistry::specs() const {
    std::vector<const CommandSpec*> result;
    for (const auto& spec : specs_) {
        result.push_back(spec.get());
    }
    std::sort(result.begin(), result.end(),
              [](const CommandSpec* a, const CommandSpec* b) { return a->name < b->name; });
    return result;
}

std::shared_ptr<const CommandRegistry> CommandRegistry::withDefaults() {
    const size_t N = CommandSpec::UNBOUNDED;
    auto registry = std::make_shared<CommandRegistry>();

    // Filesystem
    registry->add({"dir", {"ls"}, 0, 1, "[path]", "List directory contents", makeListDirectoryHandler()});
    registry->add({"cd", {"chdir"}, 0, 1, "[path]", "Change directory", makeChangeDirectoryHandler()});
    registry->add({"pwd", {}, 0, 0, "", "Print working directory", makePrintDirectoryHandler()});
    registry->add({"mkdir", {"md"}, 1, N, "<dir>...", "Create directory", makeMakeDirectoryHandler()});
    registry->add({"rmdir", {"rd"}, 1, N, "<dir>...", "Remove empty directory", makeRemoveDirectoryHandler()});
    registry->add({"del", {"rm", "erase"}, 1, N, "<file>...", "Delete file", makeDeleteFileHandler()});
    registry->add({"copy", {"cp"}, 2, 2, "<source> <destination>", "Copy file or directory", makeCopyHandler()});
    registry->add({"move", {"mv"}, 2, 2, "<source> <destination>", "Move file or directory", makeMoveHandler()});
    registry->add({"ren", {"rename"}, 2, 2, "<old> <new>", "Rename file or directory", makeRenameHandler()});
    registry->add({"type", {"cat"}, 1, 1, "<file>", "Display file contents", makeReadFileHandler()});
    registry->add({"touch", {}, 1, N, "<file>...", "Create empty file or update its timestamp", makeTouchHandler()});
    registry->add({"echo", {}, 0, N, "[text...]", "Echo text", makeEchoHandler()});

    // Processes and system
    registry->add({"tasklist", {"ps"}, 0, 1, "[name filter]", "Show running processes", makeProcessListHandler()});
    registry->add({"taskkill", {"kill"}, 1, 3, "[-9|/f] <pid> | /pid <pid> | /im <name>",
                   "Terminate a process", makeKillProcessHandler()});
    registry->add({"cpu", {}, 0, 0, "", "Show CPU usage", makeCpuHandler()});
    registry->add({"mem", {}, 0, 0, "", "Show memory usage", makeMemoryHandler()});

    // Network
    registry->add({"ipconfig", {"ifconfig"}, 0, 0, "", "Show network interfaces", makeInterfacesHandler()});
    registry->add({"ping", {}, 1, 2, "<host> [count]", "Ping a host", makePingHandler()});
    registry->add({"netstat", {}, 0, 1, "[listen]", "Show network connections", makeConnectionsHandler()});

    // Session
    registry->add({"history", {}, 0, 1, "[count]", "Show command history", makeHistoryHandler()});
    registry->add({"help", {}, 0, 1, "[command]", "Show help", makeHelpHandler()});
    registry->add({"cls", {"clear"}, 0, 0, "", "Clear the screen", makeClearScreenHandler()});
    registry->add({"exit", {"quit"}, 0, 0, "", "Exit the terminal", makeExitHandler()});

    return registry;
}

} // namespace ut

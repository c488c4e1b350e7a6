/**
 * CommandRegistry.hpp - Canonical commands, aliases and argument rules
 */

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ut {

class CommandHandler;

struct CommandSpec {
    static constexpr size_t UNBOUNDED = static_cast<size_t>(-1);

    std::string name;
    std::vector<std::string> aliases;
    size_t min_args = 0;
    size_t max_args = 0;
    std::string shape;      // e.g. "<source> <destination>"
    std::string summary;
    std::shared_ptr<const CommandHandler> handler;

    std::string usage() const;

    // Throws ValidationError when the argument count is out of range
    void checkArity(const std::vector<std::string>& args) const;
};

class CommandRegistry {
public:
    CommandRegistry();
    ~CommandRegistry();

    // Throws std::logic_error if the name or any alias is already registered
    void add(CommandSpec spec);

    // Case-insensitive over names and aliases; nullptr when unknown
    const CommandSpec* lookup(const std::string& token) const;
    bool isKnown(const std::string& token) const { return lookup(token) != nullptr; }

    std::vector<std::string> canonicalNames() const;
    std::vector<std::string> allNames() const;
    std::vector<const CommandSpec*> specs() const;
    size_t size() const { return specs_.size(); }

    static std::shared_ptr<const CommandRegistry> withDefaults();

private:
    std::vector<std::unique_ptr<CommandSpec>> specs_;
    std::map<std::string, const CommandSpec*> index_;  // lowercase name/alias
};

} // namespace ut

/**
 * ExecutionEngine.hpp - Session table and the request lifecycle
 *
 * Every request runs Received -> Classified -> Resolved -> Validated ->
 * Executed -> Recorded -> Responded. Errors of any kind come back as a
 * Result; nothing thrown by a resolver or handler leaves process().
 */

#pragma once

#include "ut/CommandRegistry.hpp"
#include "ut/Config.hpp"
#include "ut/Result.hpp"
#include "ut/Translation.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ut {

class ExecutionEngine {
public:
    // Throws std::invalid_argument if the config does not validate
    ExecutionEngine(EngineConfig config,
                    std::shared_ptr<const CommandRegistry> registry,
                    std::shared_ptr<TranslationBackend> backend);
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // New session with a random 32-hex id. Empty cwd = configured initial directory.
    // Throws std::invalid_argument if cwd is not an existing directory.
    std::string openSession(const std::string& initial_cwd = "");

    // Session under a caller-chosen id; false if the id is already taken
    bool openSession(const std::string& session_id, const std::string& initial_cwd);

    // Unknown ids are created on first contact
    Result process(const std::string& session_id, const std::string& raw_input);

    std::vector<std::string> complete(const std::string& session_id, const std::string& prefix);

    // Throw std::out_of_range for unknown ids
    std::vector<HistoryEntry> history(const std::string& session_id) const;
    std::string currentDirectory(const std::string& session_id) const;
    int lastExitStatus(const std::string& session_id) const;

    // Interrupts the in-flight request of one session; false if it was idle or unknown
    bool cancel(const std::string& session_id);

    bool closeSession(const std::string& session_id);

    // Drops sessions idle longer than session_idle_timeout; returns how many
    size_t reapIdleSessions();

    size_t sessionCount() const;

    const EngineConfig& config() const;
    const CommandRegistry& registry() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ut

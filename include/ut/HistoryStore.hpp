/**
 * HistoryStore.hpp - Per-session command history and prefix completion
 */

#pragma once

#include "ut/Result.hpp"

#include <shared_mutex>
#include <string>
#include <vector>

namespace ut {

class HistoryStore {
public:
    HistoryStore() = default;

    void append(HistoryEntry entry);

    // Snapshot of the committed entries, oldest first
    std::vector<HistoryEntry> entries() const;
    size_t size() const;

    // Command names matching `prefix` first, then entries of `cwd`, each group sorted.
    // A prefix containing whitespace completes its last word against the filesystem
    // and returns whole lines.
    std::vector<std::string> complete(const std::string& prefix,
                                      const std::string& cwd,
                                      const std::vector<std::string>& command_names) const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<HistoryEntry> entries_;
};

} // namespace ut

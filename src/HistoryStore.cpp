/**
 * HistoryStore.cpp - Per-session command history and prefix completion
 */

#include "ut/HistoryStore.hpp"
#include "ut/CommandParser.hpp"
#include "ut/Handlers.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace ut {

namespace {

// Entries of the directory named by `word`'s directory part whose names start with its last component
std::vector<std::string> completePath(const std::string& word, const std::string& cwd) {
    std::string dir_part;
    std::string base = word;
    size_t slash = word.rfind('/');
    if (slash != std::string::npos) {
        dir_part = word.substr(0, slash + 1);
        base = word.substr(slash + 1);
    }

    std::string directory = dir_part.empty() ? cwd : resolvePath(dir_part, cwd);
    bool show_hidden = !base.empty() && base[0] == '.';

    std::vector<std::string> matches;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return matches;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::string name = it->path().filename().string();
        if (name.compare(0, base.size(), base) != 0) continue;
        if (!show_hidden && !name.empty() && name[0] == '.') continue;

        std::error_code type_ec;
        bool is_dir = it->is_directory(type_ec);
        matches.push_back(dir_part + name + (is_dir ? "/" : ""));
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}

} // anonymous namespace

void HistoryStore::append(HistoryEntry entry) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
}

std::vector<HistoryEntry> HistoryStore::entries() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_;
}

size_t HistoryStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::string> HistoryStore::complete(const std::string& prefix,
                                                const std::string& cwd,
                                                const std::vector<std::string>& command_names) const {
    std::vector<std::string> candidates;

    size_t last_space = prefix.find_last_of(" \t");
    if (last_space != std::string::npos) {
        // Argument position: keep the line, complete the last word
        std::string line_head = prefix.substr(0, last_space + 1);
        for (const auto& match : completePath(prefix.substr(last_space + 1), cwd)) {
            candidates.push_back(line_head + match);
        }
        return candidates;
    }

    std::string lower = CommandParser::toLower(prefix);
    std::vector<std::string> commands;
    for (const auto& name : command_names) {
        if (name.compare(0, lower.size(), lower) == 0) {
            commands.push_back(name);
        }
    }
    std::sort(commands.begin(), commands.end());
    commands.erase(std::unique(commands.begin(), commands.end()), commands.end());
    candidates = commands;

    for (const auto& match : completePath(prefix, cwd)) {
        if (std::find(commands.begin(), commands.end(), match) == commands.end()) {
            candidates.push_back(match);
        }
    }

    return candidates;
}

} // namespace ut

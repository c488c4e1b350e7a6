/**
 * KeywordTranslator.cpp - Offline rule-based request translation
 *
 * Rules are tried in order; the first whose keywords all appear produces the
 * command. Nothing matched means an empty reply, never a default command.
 */

#include "ut/KeywordTranslator.hpp"
#include "ut/CommandParser.hpp"
#include "ut/Log.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <regex>
#include <set>
#include <vector>

namespace ut {

namespace {

const std::set<std::string> FILLERS = {
    "the", "a", "an", "my", "this", "that", "file", "files", "folder", "directory",
    "named", "called", "process", "program", "task", "with", "id", "of", "new"
};

std::string stripPunctuation(std::string word) {
    while (!word.empty() && (word.back() == ',' || word.back() == '?' || word.back() == '!' ||
                             word.back() == '.' || word.back() == ';')) {
        word.pop_back();
    }
    return word;
}

std::string quoteIfNeeded(const std::string& word) {
    if (word.find_first_of(" \t") == std::string::npos) return word;
    return "\"" + word + "\"";
}

} // anonymous namespace

struct KeywordTranslator::Impl {
    CommandParser parser;

    struct Request {
        std::string original;               // intent text, original case
        std::string lower;                  // whole request, lowercase
        std::set<std::string> words;        // lowercase words, punctuation stripped
        std::vector<std::string> tokens;    // original case, quotes honored
    };

    using Rule = std::function<std::string(const Request&)>;
    std::vector<Rule> rules;

    static bool any(const Request& r, const std::vector<std::string>& words) {
        for (const auto& w : words) {
            if (w.find(' ') != std::string::npos) {
                if (r.lower.find(w) != std::string::npos) return true;
            } else if (r.words.count(w)) {
                return true;
            }
        }
        return false;
    }

    // Token following the first of `markers`, skipping filler words
    static std::string after(const Request& r, const std::vector<std::string>& markers) {
        for (size_t i = 0; i < r.tokens.size(); ++i) {
            std::string lower = CommandParser::toLower(stripPunctuation(r.tokens[i]));
            if (std::find(markers.begin(), markers.end(), lower) == markers.end()) continue;

            for (size_t j = i + 1; j < r.tokens.size(); ++j) {
                std::string candidate = stripPunctuation(r.tokens[j]);
                if (candidate.empty()) continue;
                if (FILLERS.count(CommandParser::toLower(candidate))) continue;
                return candidate;
            }
        }
        return "";
    }

    // First token that looks like a file name or path
    static std::string pathLike(const Request& r) {
        for (const auto& token : r.tokens) {
            std::string word = stripPunctuation(token);
            size_t dot = word.find('.');
            bool dotted = dot != std::string::npos && dot > 0 && dot + 1 < word.size();
            if (dotted || word.find('/') != std::string::npos) return word;
        }
        return "";
    }

    static std::string named(const Request& r, const std::vector<std::string>& objects) {
        std::string name = after(r, {"called", "named"});
        if (name.empty()) name = pathLike(r);
        if (name.empty()) name = after(r, objects);
        return name;
    }

    static std::string withArg(const std::string& command, const std::string& arg) {
        return arg.empty() ? "" : command + " " + quoteIfNeeded(arg);
    }

    static std::string withArgs(const std::string& command, const std::string& a, const std::string& b) {
        if (a.empty() || b.empty()) return "";
        return command + " " + quoteIfNeeded(a) + " " + quoteIfNeeded(b);
    }

    Impl() {
        const std::vector<std::string> create = {"create", "make", "new", "add"};
        const std::vector<std::string> remove = {"delete", "remove", "erase", "trash"};
        const std::vector<std::string> folder = {"folder", "directory", "dir"};
        const std::vector<std::string> file = {"file"};

        rules.push_back([=](const Request& r) {
            if (!any(r, create) || !any(r, folder)) return std::string();
            return withArg("mkdir", named(r, folder));
        });
        rules.push_back([=](const Request& r) {
            if (!any(r, create) || !any(r, file)) return std::string();
            return withArg("touch", named(r, file));
        });
        rules.push_back([=](const Request& r) {
            if (!any(r, remove) || !any(r, folder)) return std::string();
            return withArg("rmdir", named(r, folder));
        });
        rules.push_back([=](const Request& r) {
            if (!any(r, remove) || !(any(r, file) || !pathLike(r).empty())) return std::string();
            return withArg("del", named(r, file));
        });
        rules.push_back([](const Request& r) {
            if (!any(r, {"rename"})) return std::string();
            return withArgs("ren", after(r, {"rename"}), after(r, {"to", "as"}));
        });
        rules.push_back([](const Request& r) {
            if (!any(r, {"copy", "duplicate"})) return std::string();
            std::string source = pathLike(r);
            if (source.empty()) source = after(r, {"copy", "duplicate"});
            return withArgs("copy", source, after(r, {"to", "into"}));
        });
        rules.push_back([](const Request& r) {
            if (!any(r, {"move", "transfer", "relocate"})) return std::string();
            std::string source = pathLike(r);
            if (source.empty()) source = after(r, {"move", "transfer", "relocate"});
            return withArgs("move", source, after(r, {"to", "into", "in"}));
        });
        rules.push_back([](const Request& r) {
            if (!any(r, {"show", "display", "read", "print", "open"}) ||
                !any(r, {"content", "contents", "inside"})) return std::string();
            std::string name = pathLike(r);
            if (name.empty()) name = after(r, {"of", "file"});
            return withArg("type", name);
        });
        rules.push_back([](const Request& r) {
            if (!any(r, {"kill", "terminate", "end", "stop"}) ||
                !any(r, {"process", "task", "program", "pid"})) return std::string();
            std::smatch match;
            if (std::regex_search(r.lower, match, std::regex(R"((?:id|pid)\s+(\d+))")) ||
                std::regex_search(r.lower, match, std::regex(R"(\b(\d+)\b)"))) {
                return "taskkill /pid " + match[1].str();
            }
            std::string image = after(r, {"process", "program", "task", "kill", "terminate", "stop", "end"});
            return image.empty() ? std::string() : "taskkill /im " + quoteIfNeeded(image);
        });
        rules.push_back([](const Request& r) {
            if (!any(r, {"process", "processes", "running", "tasks", "programs"})) return std::string();
            return std::string("tasklist");
        });
        rules.push_back([](const Request& r) {
            return any(r, {"cpu", "processor"}) ? std::string("cpu") : std::string();
        });
        rules.push_back([](const Request& r) {
            return any(r, {"memory", "ram"}) ? std::string("mem") : std::string();
        });
        rules.push_back([](const Request& r) {
            if (any(r, {"list", "show", "display", "see", "files"})) return std::string();
            return any(r, {"where am i", "current directory", "working directory", "current folder"})
                ? std::string("pwd") : std::string();
        });
        rules.push_back([=](const Request& r) {
            if (!any(r, {"go", "change", "navigate", "enter", "switch"})) return std::string();
            if (any(r, {"parent", "up one", "back"})) return std::string("cd ..");
            if (any(r, {"home"})) return std::string("cd ~");
            if (!any(r, folder) && !any(r, {"to", "into"})) return std::string();
            return withArg("cd", after(r, {"to", "into"}));
        });
        rules.push_back([](const Request& r) {
            return any(r, {"ip address", "ip addresses", "network configuration", "network config", "interfaces"})
                ? std::string("ipconfig") : std::string();
        });
        rules.push_back([](const Request& r) {
            if (!any(r, {"ping", "reach", "reachable", "test connection"})) return std::string();
            std::string host = after(r, {"ping", "reach", "to"});
            return withArg("ping", host);
        });
        rules.push_back([](const Request& r) {
            return any(r, {"connections", "ports", "sockets", "netstat"})
                ? (any(r, {"listening", "listen"}) ? std::string("netstat listen") : std::string("netstat"))
                : std::string();
        });
        rules.push_back([=](const Request& r) {
            if (!any(r, {"list", "show", "display", "see"}) ||
                !any(r, {"file", "files", "folder", "folders", "directory", "contents"})) return std::string();
            return std::string("dir");
        });
        rules.push_back([](const Request& r) {
            return any(r, {"clear", "clean"}) && any(r, {"screen", "console", "terminal"})
                ? std::string("cls") : std::string();
        });
        rules.push_back([](const Request& r) {
            static const std::regex echo_pattern(R"(^\s*(?:echo|print|say)\s+(.+)$)", std::regex::icase);
            std::smatch match;
            if (!std::regex_search(r.original, match, echo_pattern)) return std::string();
            return "echo " + match[1].str();
        });
        rules.push_back([](const Request& r) {
            return any(r, {"history", "previous commands"}) ? std::string("history") : std::string();
        });
        rules.push_back([](const Request& r) {
            return any(r, {"help", "what can i do", "commands"}) ? std::string("help") : std::string();
        });
    }

    std::string apply(const std::string& text) const {
        Request request;
        request.original = parser.extractIntent(text);
        request.lower = CommandParser::toLower(request.original);
        request.tokens = parser.tokenize(request.original);
        for (const auto& token : request.tokens) {
            std::string word = CommandParser::toLower(stripPunctuation(token));
            if (!word.empty()) request.words.insert(word);
        }

        for (const auto& rule : rules) {
            std::string command = rule(request);
            if (!command.empty()) return command;
        }
        return "";
    }
};

KeywordTranslator::KeywordTranslator() : impl_(std::make_unique<Impl>()) {}

KeywordTranslator::~KeywordTranslator() = default;

TranslationReply KeywordTranslator::translate(const TranslationRequest& request) {
    TranslationReply reply;
    reply.command_line = impl_->apply(request.text);
    if (reply.command_line.empty()) {
        Logger::debug("keywords", "no rule matched '" + request.text + "'");
    }
    return reply;
}

} // namespace ut

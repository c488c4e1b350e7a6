/**
 * CommandParser.hpp - Split literal command lines and clean up requests
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace ut {

struct ParsedCommand {
    std::string name;
    std::vector<std::string> args;
    std::string raw_input;
};

class CommandParser {
public:
    CommandParser();
    ~CommandParser();

    ParsedCommand parse(const std::string& input) const;

    // Quote-aware split: "a 'b c'" -> {a, b c}
    std::vector<std::string> tokenize(const std::string& input) const;

    // First whitespace-delimited word, without quote handling
    std::string leadingToken(const std::string& input) const;

    // True when ; && || or | appear outside quotes
    bool hasCommandSeparator(const std::string& input) const;

    std::string extractIntent(const std::string& request) const;

    static std::string trim(const std::string& text);
    static std::string toLower(const std::string& text);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ut

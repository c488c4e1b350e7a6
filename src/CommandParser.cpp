/**
 * CommandParser.cpp - Split literal command lines and clean up requests
 */

#include "ut/CommandParser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace ut {

struct CommandParser::Impl {
    std::vector<std::string> request_prefixes = {
        "please ", "can you ", "could you ", "would you ", "i want to ",
        "i'd like to ", "how do i ", "how can i ", "help me "
    };

    std::vector<std::string> tokenize(const std::string& input) const {
        std::vector<std::string> tokens;
        std::string current;
        bool has_token = false;
        char quote = 0;

        for (char c : input) {
            if (quote != 0) {
                if (c == quote) {
                    quote = 0;
                } else {
                    current += c;
                }
            } else if (c == '"' || c == '\'') {
                quote = c;
                has_token = true;
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                if (has_token) {
                    tokens.push_back(current);
                    current.clear();
                    has_token = false;
                }
            } else {
                current += c;
                has_token = true;
            }
        }

        // An unterminated quote runs to end of line
        if (has_token) {
            tokens.push_back(current);
        }

        return tokens;
    }
};

CommandParser::CommandParser() : impl_(std::make_unique<Impl>()) {}

CommandParser::~CommandParser() = default;

ParsedCommand CommandParser::parse(const std::string& input) const {
    ParsedCommand result;
    result.raw_input = input;

    auto tokens = impl_->tokenize(input);

    if (tokens.empty()) {
        return result;
    }

    result.name = tokens[0];
    result.args.assign(tokens.begin() + 1, tokens.end());

    return result;
}

std::vector<std::string> CommandParser::tokenize(const std::string& input) const {
    return impl_->tokenize(input);
}

std::string CommandParser::leadingToken(const std::string& input) const {
    std::istringstream iss(input);
    std::string token;
    iss >> token;
    return token;
}

bool CommandParser::hasCommandSeparator(const std::string& input) const {
    char quote = 0;
    for (char c : input) {
        if (quote != 0) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == ';' || c == '|' || c == '&') {
            // a lone & is background execution, equally unsupported
            return true;
        }
    }
    return false;
}

std::string CommandParser::extractIntent(const std::string& request) const {
    std::string intent = trim(request);

    // Remove trailing punctuation
    while (!intent.empty() && (intent.back() == '?' || intent.back() == '.' || intent.back() == '!')) {
        intent.pop_back();
    }

    std::string lower = toLower(intent);

    for (const auto& prefix : impl_->request_prefixes) {
        if (lower.find(prefix) == 0) {
            intent = intent.substr(prefix.size());
            break;
        }
    }

    return trim(intent);
}

std::string CommandParser::trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::string CommandParser::toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace ut

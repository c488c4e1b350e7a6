/**
 * Resolver.hpp - Turn raw input into one supported command line
 *
 * Input whose first word is a known command is used as-is. Anything else is
 * sent to the translation backend, bounded by a timeout, and the reply is
 * accepted only if it names a registered command.
 */

#pragma once

#include "ut/CommandParser.hpp"
#include "ut/CommandRegistry.hpp"
#include "ut/Translation.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace ut {

struct Resolution {
    std::string command_line;
    bool translated = false;
};

class Resolver {
public:
    Resolver(std::shared_ptr<const CommandRegistry> registry,
             std::shared_ptr<TranslationBackend> backend,
             std::chrono::milliseconds timeout);

    // Throws ResolutionError: Unrecognized, Unavailable or Cancelled
    Resolution resolve(const std::string& raw_input, const std::atomic<bool>* cancel = nullptr);

    // Number of times the backend has been consulted
    size_t callCount() const { return calls_.load(); }

    // Strips code fences, backticks, surrounding quotes and a "$ " prompt
    static std::string normalizeReply(const std::string& reply);

private:
    std::string translate(const std::string& raw_input, const std::atomic<bool>* cancel);

    std::shared_ptr<const CommandRegistry> registry_;
    std::shared_ptr<TranslationBackend> backend_;
    std::chrono::milliseconds timeout_;
    CommandParser parser_;
    std::atomic<size_t> calls_{0};
};

} // namespace ut

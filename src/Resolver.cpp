/**
 * Resolver.cpp - Local match first, bounded backend fallback
 */

#include "ut/Resolver.hpp"
#include "ut/Log.hpp"
#include "ut/Result.hpp"

#include <algorithm>
#include <future>
#include <thread>

namespace ut {

namespace {

const auto POLL_INTERVAL = std::chrono::milliseconds(20);

std::string stripWrapping(std::string text, const std::string& open, const std::string& close) {
    if (text.size() >= open.size() + close.size() &&
        text.compare(0, open.size(), open) == 0 &&
        text.compare(text.size() - close.size(), close.size(), close) == 0) {
        text = text.substr(open.size(), text.size() - open.size() - close.size());
    }
    return CommandParser::trim(text);
}

} // anonymous namespace

Resolver::Resolver(std::shared_ptr<const CommandRegistry> registry,
                   std::shared_ptr<TranslationBackend> backend,
                   std::chrono::milliseconds timeout)
    : registry_(std::move(registry)), backend_(std::move(backend)), timeout_(timeout) {}

std::string Resolver::normalizeReply(const std::string& reply) {
    std::string text = CommandParser::trim(reply);

    // ```bash\ncmd\n``` -> cmd
    if (text.compare(0, 3, "```") == 0) {
        size_t first_newline = text.find('\n');
        size_t closing = text.rfind("```");
        if (first_newline != std::string::npos && closing != std::string::npos && closing > first_newline) {
            text = CommandParser::trim(text.substr(first_newline + 1, closing - first_newline - 1));
        } else {
            text = stripWrapping(text, "```", "```");
        }
    }

    text = stripWrapping(text, "`", "`");
    text = stripWrapping(text, "\"", "\"");
    text = stripWrapping(text, "'", "'");

    if (text.compare(0, 2, "$ ") == 0) {
        text = CommandParser::trim(text.substr(2));
    }
    return text;
}

Resolution Resolver::resolve(const std::string& raw_input, const std::atomic<bool>* cancel) {
    std::string input = CommandParser::trim(raw_input);

    Resolution resolution;
    if (registry_->isKnown(parser_.leadingToken(input))) {
        resolution.command_line = input;
        return resolution;
    }

    std::string reply = normalizeReply(translate(input, cancel));

    if (reply.empty()) {
        throw ResolutionError(ErrorKind::Unrecognized, "Unrecognized command: " + input);
    }
    if (reply.find('\n') != std::string::npos || parser_.hasCommandSeparator(reply)) {
        Logger::warning("resolver", "rejected compound reply for '" + input + "'");
        throw ResolutionError(ErrorKind::Unrecognized,
                              "Unrecognized command: " + input + " (resolver proposed more than one command)");
    }
    if (!registry_->isKnown(parser_.leadingToken(reply))) {
        Logger::info("resolver", "reply '" + reply + "' is not a supported command");
        throw ResolutionError(ErrorKind::Unrecognized, "Unrecognized command: " + input);
    }

    Logger::debug("resolver", "'" + input + "' -> '" + reply + "'");
    resolution.command_line = reply;
    resolution.translated = true;
    return resolution;
}

std::string Resolver::translate(const std::string& raw_input, const std::atomic<bool>* cancel) {
    if (!backend_) {
        throw ResolutionError(ErrorKind::Unavailable, "Natural-language resolver is not configured");
    }

    TranslationRequest request;
    request.text = raw_input;
    request.commands = registry_->canonicalNames();

    calls_++;

    // The worker owns its own references so a slow backend can outlive this call
    auto promise = std::make_shared<std::promise<TranslationReply>>();
    std::future<TranslationReply> future = promise->get_future();
    std::shared_ptr<TranslationBackend> backend = backend_;

    std::thread([promise, backend, request]() {
        try {
            promise->set_value(backend->translate(request));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (true) {
        if (cancel != nullptr && cancel->load()) {
            throw ResolutionError(ErrorKind::Cancelled, "Cancelled");
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            Logger::warning("resolver", backend->name() + " did not answer within " +
                            std::to_string(timeout_.count()) + " ms");
            throw ResolutionError(ErrorKind::Unavailable, "Natural-language resolver timed out");
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(POLL_INTERVAL, deadline - now);
        if (future.wait_for(slice) == std::future_status::ready) {
            break;
        }
    }

    try {
        return future.get().command_line;
    } catch (const TransportError& e) {
        Logger::warning("resolver", backend->name() + ": " + e.what());
        throw ResolutionError(ErrorKind::Unavailable, std::string("Natural-language resolver unavailable: ") + e.what());
    } catch (const UtError&) {
        throw;
    } catch (const std::exception& e) {
        Logger::error("resolver", backend->name() + " failed: " + e.what());
        throw ResolutionError(ErrorKind::Unavailable, std::string("Natural-language resolver failed: ") + e.what());
    }
}

} // namespace ut

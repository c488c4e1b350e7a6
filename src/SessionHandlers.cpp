/**
 * SessionHandlers.cpp - echo, history, help and front-end controls
 */

#include "ut/Handlers.hpp"
#include "ut/CommandRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace ut {

namespace {

class EchoHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext&) const override {
        std::string text;
        for (size_t i = 0; i < args.size(); ++i) {
            if (i > 0) text += " ";
            text += args[i];
        }
        return Result::success(text + "\n");
    }
};

class HistoryHandler : public CommandHandler {
public:
    void validate(const std::vector<std::string>& args) const override {
        if (!args.empty() && !isCount(args[0])) {
            throw ValidationError("history: count must be a positive number");
        }
    }

    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        if (ctx.history == nullptr || ctx.history->empty()) {
            return Result::success("No command history\n");
        }

        const auto& entries = *ctx.history;
        size_t start = 0;
        if (!args.empty()) {
            size_t count = std::stoul(args[0]);
            if (count < entries.size()) start = entries.size() - count;
        }

        std::ostringstream out;
        for (size_t i = start; i < entries.size(); ++i) {
            const auto& entry = entries[i];
            out << std::setw(5) << (i + 1) << "  " << entry.raw_input;
            if (!entry.resolved_command.empty() && entry.resolved_command != entry.raw_input) {
                out << "  -> " << entry.resolved_command;
            }
            if (entry.result.exit_status != 0) {
                out << "  [exit " << entry.result.exit_status << "]";
            }
            out << "\n";
        }
        return Result::success(out.str());
    }

private:
    static bool isCount(const std::string& text) {
        return !text.empty() && text.size() < 9 && text != "0" &&
               std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
    }
};

class HelpHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>& args, const HandlerContext& ctx) const override {
        if (ctx.registry == nullptr) {
            throw HandlerError(ErrorKind::Internal, "help: no command registry");
        }

        if (!args.empty()) {
            const CommandSpec* spec = ctx.registry->lookup(args[0]);
            if (spec == nullptr) {
                throw HandlerError(ErrorKind::NotFound, "help: unknown command '" + args[0] + "'");
            }
            std::ostringstream out;
            out << "Usage: " << spec->usage() << "\n" << spec->summary << "\n";
            if (!spec->aliases.empty()) {
                out << "Aliases:";
                for (const auto& alias : spec->aliases) out << " " << alias;
                out << "\n";
            }
            return Result::success(out.str());
        }

        std::ostringstream out;
        out << "Available commands:\n";
        for (const CommandSpec* spec : ctx.registry->specs()) {
            std::string aliases;
            for (const auto& alias : spec->aliases) {
                aliases += aliases.empty() ? alias : ", " + alias;
            }
            out << "  " << std::left << std::setw(40) << spec->usage() << spec->summary;
            if (!aliases.empty()) out << " (" << aliases << ")";
            out << "\n";
        }
        out << "\nAnything else is treated as a natural-language request, e.g.\n"
            << "  \"create a folder called test\"  -> mkdir test\n"
            << "  \"show all running processes\"   -> tasklist\n";
        return Result::success(out.str());
    }
};

class ClearScreenHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>&, const HandlerContext&) const override {
        return Result::withControl(Control::ClearScreen);
    }
};

class ExitHandler : public CommandHandler {
public:
    Result execute(const std::vector<std::string>&, const HandlerContext&) const override {
        return Result::withControl(Control::Exit);
    }
};

} // anonymous namespace

HandlerPtr makeEchoHandler() { return std::make_shared<EchoHandler>(); }
HandlerPtr makeHistoryHandler() { return std::make_shared<HistoryHandler>(); }
HandlerPtr makeHelpHandler() { return std::make_shared<HelpHandler>(); }
HandlerPtr makeClearScreenHandler() { return std::make_shared<ClearScreenHandler>(); }
HandlerPtr makeExitHandler() { return std::make_shared<ExitHandler>(); }

} // namespace ut

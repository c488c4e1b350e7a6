/**
 * main.cpp - UnifiedTerminal console entry point
 *
 * Usage:
 *   ut                                   # Interactive console
 *   ut dir /tmp                          # One-shot literal command
 *   ut "make a folder named notes"       # One-shot natural-language request
 *   ut --auth                            # Store API key securely
 *   ut --config model=<name>             # Change configuration
 */

#include "ut/CommandRegistry.hpp"
#include "ut/Config.hpp"
#include "ut/ExecutionEngine.hpp"
#include "ut/GeminiClient.hpp"
#include "ut/KeywordTranslator.hpp"
#include "ut/Log.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <pthread.h>
#include <signal.h>
#include <termios.h>
#include <unistd.h>
#include <vector>

namespace {

const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string YELLOW = "\033[33m";
const std::string GREEN = "\033[32m";
const std::string RED = "\033[31m";
const std::string CYAN = "\033[36m";

void printUsage(const ut::EngineConfig& config) {
    std::cout << BOLD << "UnifiedTerminal" << RESET << " - commands or plain language, one terminal\n\n"
              << BOLD << "Usage:" << RESET << "\n"
              << "  ut                               Interactive console\n"
              << "  ut --console                     Interactive console\n"
              << "  ut <command> [args...]           Run one command and exit with its status\n"
              << "  ut \"request in plain language\"   Translate, run and exit\n"
              << "  ut --auth                        Store API key securely\n"
              << "  ut --config list                 Show current configuration\n"
              << "  ut --config model=<name>         Set Gemini model\n"
              << "  ut --config timeout=<ms>         Set resolver timeout\n"
              << "  ut --config offline=<true|false> Use keyword rules instead of the model\n"
              << "  ut --help                        Show this help\n\n"
              << BOLD << "Console:" << RESET << "\n"
              << "  ?<prefix>                        List completions for <prefix>\n"
              << "  Ctrl-C                           Cancel the running command\n"
              << "  help, exit                       Command list, leave\n\n"
              << BOLD << "Current Config:" << RESET << "\n"
              << "  Model:    " << config.model << "\n"
              << "  Resolver: " << (config.offline || config.api_key.empty() ? "keywords" : "gemini") << "\n";
}

std::string readHidden(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    struct termios old_term, new_term;
    bool is_tty = tcgetattr(STDIN_FILENO, &old_term) == 0;
    if (is_tty) {
        new_term = old_term;
        new_term.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &new_term);
    }

    std::string value;
    std::getline(std::cin, value);

    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
    }
    std::cout << "\n";
    return value;
}

std::shared_ptr<ut::TranslationBackend> makeBackend(const ut::EngineConfig& config) {
    if (config.offline || config.api_key.empty()) {
        ut::Logger::info("main", "natural-language requests use keyword rules");
        return std::make_shared<ut::KeywordTranslator>();
    }
    return std::make_shared<ut::GeminiClient>(config.api_key, config.model, config.api_host,
                                              config.resolver_timeout);
}

int runAuth(const ut::EngineConfig& config) {
    std::string new_key = readHidden("Paste your API key (hidden input): ");
    if (new_key.empty()) {
        std::cerr << RED << "Error: Empty API key." << RESET << "\n";
        return 1;
    }

    std::cout << "Validating API key...\n";
    ut::GeminiClient test_client(new_key, config.model, config.api_host, config.resolver_timeout);
    std::string error_msg;
    if (!test_client.validate(error_msg)) {
        std::cerr << RED << "Error: Invalid API key - " << error_msg << RESET << "\n";
        return 1;
    }

    if (!ut::storeInKeyring("api_key", new_key, "UnifiedTerminal API Key", error_msg)) {
        std::cerr << RED << "Error saving: " << error_msg << RESET << "\n";
        return 1;
    }
    std::cout << GREEN << "API key validated and saved!" << RESET << "\n";
    return 0;
}

int saveOrReport(const ut::EngineConfig& config, const std::string& done) {
    std::string error_msg;
    if (!ut::saveConfigFile(config, error_msg)) {
        std::cerr << RED << "Error: " << error_msg << RESET << "\n";
        return 1;
    }
    std::cout << GREEN << done << RESET << "\n";
    return 0;
}

int runConfig(const std::string& config_arg, ut::EngineConfig config) {
    if (config_arg == "list") {
        std::cout << BOLD << "Current Configuration:" << RESET << "  (" << ut::configFilePath() << ")\n"
                  << "  Model:            " << config.model << "\n"
                  << "  API host:         " << config.api_host << "\n"
                  << "  API key:          " << (config.api_key.empty() ? "not configured" : "configured") << "\n"
                  << "  Resolver timeout: " << config.resolver_timeout.count() << " ms\n"
                  << "  Handler timeout:  " << config.handler_timeout.count() << " ms\n"
                  << "  Offline:          " << (config.offline ? "true" : "false") << "\n"
                  << "  Log level:        " << ut::Logger::levelName(config.log_level) << "\n";
        return 0;
    }

    if (config_arg.rfind("model=", 0) == 0) {
        std::string new_model = config_arg.substr(6);
        if (new_model.empty()) {
            std::cerr << RED << "Error: Empty model name." << RESET << "\n";
            return 1;
        }
        if (config.api_key.empty()) {
            std::cerr << RED << "Error: Configure API key first with 'ut --auth'" << RESET << "\n";
            return 1;
        }

        std::cout << "Validating model " << new_model << "...\n";
        ut::GeminiClient test_client(config.api_key, new_model, config.api_host, config.resolver_timeout);
        std::string error_msg;
        if (!test_client.validate(error_msg)) {
            std::cerr << RED << "Error: Invalid model - " << error_msg << RESET << "\n";
            return 1;
        }
        config.model = new_model;
        return saveOrReport(config, "Model validated and set: " + new_model);
    }

    if (config_arg.rfind("timeout=", 0) == 0) {
        long long ms = 0;
        try {
            ms = std::stoll(config_arg.substr(8));
        } catch (const std::exception&) {
            ms = 0;
        }
        if (ms <= 0) {
            std::cerr << RED << "Error: timeout must be a positive number of milliseconds." << RESET << "\n";
            return 1;
        }
        config.resolver_timeout = std::chrono::milliseconds(ms);
        return saveOrReport(config, "Resolver timeout set: " + std::to_string(ms) + " ms");
    }

    if (config_arg.rfind("offline=", 0) == 0) {
        std::string value = config_arg.substr(8);
        if (value != "true" && value != "false") {
            std::cerr << RED << "Error: offline must be true or false." << RESET << "\n";
            return 1;
        }
        config.offline = value == "true";
        return saveOrReport(config, "Offline mode: " + value);
    }

    std::cerr << RED << "Unknown config. Use: ut --config list|model=<name>|timeout=<ms>|offline=<true|false>"
              << RESET << "\n";
    return 1;
}

void printResult(const ut::Result& result) {
    if (!result.stdout_text.empty()) {
        std::cout << result.stdout_text;
        if (result.stdout_text.back() != '\n') std::cout << "\n";
        std::cout.flush();
    }
    if (!result.stderr_text.empty()) {
        std::cerr << RED << result.stderr_text;
        if (result.stderr_text.back() != '\n') std::cerr << "\n";
        std::cerr << RESET;
    }
}

// SIGINT is blocked everywhere and collected here, so Ctrl-C only cancels
class InterruptWatcher {
public:
    InterruptWatcher(ut::ExecutionEngine& engine, std::string session_id)
        : engine_(engine), session_id_(std::move(session_id)) {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);

        thread_ = std::thread([this, set] {
            while (true) {
                int signal_number = 0;
                if (sigwait(&set, &signal_number) != 0) continue;
                if (stopping_.load()) return;
                if (signal_number == SIGINT && !engine_.cancel(session_id_)) {
                    std::cout << "^C\n";
                    std::cout.flush();
                }
            }
        });
    }

    ~InterruptWatcher() {
        stopping_ = true;
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

private:
    ut::ExecutionEngine& engine_;
    std::string session_id_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

std::string promptFor(const std::string& cwd) {
    const char* home = std::getenv("HOME");
    std::string shown = cwd;
    if (home != nullptr && *home != '\0') {
        std::string home_dir = home;
        if (shown == home_dir) {
            shown = "~";
        } else if (shown.rfind(home_dir + "/", 0) == 0) {
            shown = "~" + shown.substr(home_dir.size());
        }
    }
    return CYAN + "ut:" + shown + "$ " + RESET;
}

int runConsole(ut::ExecutionEngine& engine) {
    std::string session_id = engine.openSession();
    InterruptWatcher watcher(engine, session_id);

    std::cout << BOLD << "UnifiedTerminal" << RESET << "\n"
              << "Type commands or plain-language requests. 'help' lists commands, 'exit' leaves.\n\n";

    std::string line;
    while (true) {
        std::cout << promptFor(engine.currentDirectory(session_id));
        std::cout.flush();

        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;  // EOF
        }

        if (!line.empty() && line[0] == '?') {
            auto candidates = engine.complete(session_id, line.substr(1));
            if (candidates.empty()) {
                std::cout << YELLOW << "No completions" << RESET << "\n";
            }
            for (const auto& candidate : candidates) {
                std::cout << "  " << candidate << "\n";
            }
            continue;
        }

        ut::Result result = engine.process(session_id, line);
        printResult(result);

        if (result.control == ut::Control::ClearScreen) {
            std::cout << "\033[2J\033[H";
            std::cout.flush();
        } else if (result.control == ut::Control::Exit) {
            std::cout << "Goodbye!\n";
            break;
        }
    }

    engine.closeSession(session_id);
    return 0;
}

int runOnce(ut::ExecutionEngine& engine, int argc, char* argv[], int first) {
    std::string input;
    for (int i = first; i < argc; ++i) {
        if (i > first) input += " ";
        std::string arg = argv[i];
        bool needs_quotes = argc - first > 1 && arg.find_first_of(" \t") != std::string::npos;
        input += needs_quotes ? "\"" + arg + "\"" : arg;
    }

    std::string session_id = engine.openSession();
    ut::Result result = engine.process(session_id, input);
    printResult(result);
    return result.exit_status;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    ut::EngineConfig config = ut::loadConfig();
    ut::Logger::setLevel(config.log_level);
    if (const char* level = std::getenv("UT_LOG_LEVEL")) {
        ut::Logger::setLevel(std::string(level));
    }

    std::string first_arg = argc > 1 ? argv[1] : "";

    if (first_arg == "--help" || first_arg == "-h") {
        printUsage(config);
        return 0;
    }

    if (first_arg == "--auth") {
        if (argc != 2) {
            std::cerr << RED << "Error: --auth must be used alone." << RESET << "\n";
            std::cerr << "Usage: ut --auth\n";
            return 1;
        }
        return runAuth(config);
    }

    if (first_arg == "--config") {
        if (argc != 3) {
            std::cerr << RED << "Error: --config must be used alone with its argument." << RESET << "\n";
            std::cerr << "Usage: ut --config list|model=<name>|timeout=<ms>|offline=<true|false>\n";
            return 1;
        }
        return runConfig(argv[2], config);
    }

    if (first_arg.rfind("--", 0) == 0 && first_arg != "--console") {
        std::cerr << RED << "Error: Unknown flag '" << first_arg << "'" << RESET << "\n";
        std::cerr << "Valid flags: --console, --config, --auth, --help\n";
        return 1;
    }

    std::unique_ptr<ut::ExecutionEngine> engine;
    try {
        auto registry = ut::CommandRegistry::withDefaults();
        engine = std::make_unique<ut::ExecutionEngine>(config, registry, makeBackend(config));
    } catch (const std::exception& e) {
        std::cerr << RED << "Error: cannot start: " << e.what() << RESET << "\n";
        return 1;
    }

    if (argc < 2 || first_arg == "--console") {
        return runConsole(*engine);
    }
    return runOnce(*engine, argc, argv, 1);
}

/**
 * test_config.cpp - Unit tests for EngineConfig loading and saving
 */

#include "ut/Config.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Points HOME at a scratch directory for the duration of a test
struct ScratchHome {
    fs::path path;
    std::string saved_home;
    bool had_key = false;
    std::string saved_key;

    explicit ScratchHome(const std::string& tag) {
        path = fs::temp_directory_path() / ("ut_config_" + tag + "_" + std::to_string(::getpid()));
        fs::remove_all(path);
        fs::create_directories(path);

        const char* home = std::getenv("HOME");
        saved_home = home ? home : "";
        ::setenv("HOME", path.c_str(), 1);

        const char* key = std::getenv("GEMINI_API_KEY");
        had_key = key != nullptr;
        saved_key = key ? key : "";
        ::unsetenv("GEMINI_API_KEY");
    }

    ~ScratchHome() {
        ::setenv("HOME", saved_home.c_str(), 1);
        if (had_key) ::setenv("GEMINI_API_KEY", saved_key.c_str(), 1);
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

bool throwsInvalid(const ut::EngineConfig& config) {
    try {
        config.validate();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

} // anonymous namespace

void test_defaults() {
    ut::EngineConfig config;

    assert(config.model == "gemini-2.0-flash");
    assert(config.api_host == "generativelanguage.googleapis.com");
    assert(config.resolver_timeout == std::chrono::milliseconds(15000));
    assert(config.handler_timeout == std::chrono::milliseconds(15000));
    assert(config.session_idle_timeout == std::chrono::minutes(30));
    assert(!config.offline);
    assert(config.log_level == ut::LogLevel::WARNING);
    config.validate();

    std::cout << "[PASS] test_defaults\n";
}

void test_validate_rejects_bad_values() {
    ut::EngineConfig config;
    config.resolver_timeout = std::chrono::milliseconds(0);
    assert(throwsInvalid(config));

    config = ut::EngineConfig();
    config.handler_timeout = std::chrono::milliseconds(-5);
    assert(throwsInvalid(config));

    config = ut::EngineConfig();
    config.model.clear();
    assert(throwsInvalid(config));

    config = ut::EngineConfig();
    config.initial_directory = "/definitely/not/a/real/dir";
    assert(throwsInvalid(config));

    std::cout << "[PASS] test_validate_rejects_bad_values\n";
}

void test_apply_json() {
    ut::EngineConfig config;
    ut::applyConfigJson(config, R"({
        "model": "gemini-2.5-pro",
        "resolver_timeout_ms": 2500,
        "session_idle_timeout_s": 60,
        "offline": true,
        "log_level": "debug",
        "unknown_key": 1
    })");

    assert(config.model == "gemini-2.5-pro");
    assert(config.resolver_timeout == std::chrono::milliseconds(2500));
    assert(config.handler_timeout == std::chrono::milliseconds(15000));
    assert(config.session_idle_timeout == std::chrono::seconds(60));
    assert(config.offline);
    assert(config.log_level == ut::LogLevel::DEBUG);

    // Parsing does not touch the process-wide log level
    assert(ut::Logger::level() == ut::LogLevel::WARNING);

    std::cout << "[PASS] test_apply_json\n";
}

void test_apply_json_rejects_malformed() {
    ut::EngineConfig config;
    bool threw = false;
    try {
        ut::applyConfigJson(config, "{ not json");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ut::applyConfigJson(config, R"({"resolver_timeout_ms": "fast"})");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ut::applyConfigJson(config, R"({"log_level": "chatty"})");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_apply_json_rejects_malformed\n";
}

void test_save_and_load_round_trip() {
    ScratchHome home("save");

    ut::EngineConfig config;
    config.model = "gemini-custom";
    config.resolver_timeout = std::chrono::milliseconds(4000);
    config.offline = true;
    config.api_key = "never-written";

    std::string error;
    assert(ut::saveConfigFile(config, error));
    assert(ut::configFilePath() == (home.path / ".config" / "ut" / "config.json").string());

    struct stat info;
    assert(::stat(ut::configFilePath().c_str(), &info) == 0);
    assert((info.st_mode & 0777) == 0600);

    std::ifstream file(ut::configFilePath());
    std::stringstream text;
    text << file.rdbuf();
    json doc = json::parse(text.str());
    assert(!doc.contains("api_key"));
    assert(doc["model"] == "gemini-custom");

    ut::EngineConfig loaded;
    ut::applyConfigJson(loaded, text.str());
    assert(loaded.model == "gemini-custom");
    assert(loaded.resolver_timeout == std::chrono::milliseconds(4000));
    assert(loaded.offline);

    std::cout << "[PASS] test_save_and_load_round_trip\n";
}

void test_api_key_from_environment_and_file() {
    ScratchHome home("key");
    if (!ut::getFromKeyring("api_key").empty()) {
        std::cout << "[SKIP] test_api_key_from_environment_and_file (keyring entry present)\n";
        return;
    }

    assert(ut::lookupApiKey().empty());

    fs::create_directories(home.path / ".config" / "ut");
    std::ofstream(home.path / ".config" / "ut" / "api_key") << "file-key\n";
    assert(ut::lookupApiKey() == "file-key");

    ::setenv("GEMINI_API_KEY", "env-key", 1);
    assert(ut::lookupApiKey() == "env-key");
    ::unsetenv("GEMINI_API_KEY");

    std::cout << "[PASS] test_api_key_from_environment_and_file\n";
}

void test_malformed_file_falls_back_to_defaults() {
    ScratchHome home("malformed");
    fs::create_directories(home.path / ".config" / "ut");
    std::ofstream(ut::configFilePath()) << "{ \"model\": ";

    ut::EngineConfig config = ut::loadConfig();
    assert(config.model == "gemini-2.0-flash");
    config.validate();

    std::cout << "[PASS] test_malformed_file_falls_back_to_defaults\n";
}

int main() {
    std::cout << "Running Config tests...\n\n";

    test_defaults();
    test_validate_rejects_bad_values();
    test_apply_json();
    test_apply_json_rejects_malformed();
    test_save_and_load_round_trip();
    test_api_key_from_environment_and_file();
    test_malformed_file_falls_back_to_defaults();

    std::cout << "\nAll tests passed!\n";
    return 0;
}

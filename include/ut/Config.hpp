/**
 * Config.hpp - Engine configuration, config file and keyring credentials
 */

#pragma once

#include "ut/Log.hpp"

#include <chrono>
#include <string>

namespace ut {

struct EngineConfig {
    std::string api_key;
    std::string model = "gemini-2.0-flash";
    std::string api_host = "generativelanguage.googleapis.com";
    std::chrono::milliseconds resolver_timeout{15000};
    std::chrono::milliseconds handler_timeout{15000};
    std::chrono::seconds session_idle_timeout{30 * 60};
    std::string initial_directory;   // empty = process working directory
    bool offline = false;            // keyword rules instead of the language model
    LogLevel log_level = LogLevel::WARNING;

    // Throws std::invalid_argument for values the engine cannot run with
    void validate() const;
};

// ~/.config/ut
std::string configDirectory();
std::string configFilePath();

// Defaults, then the JSON config file (if any), then credentials
EngineConfig loadConfig();

// Applies the keys present in a JSON document; unknown keys are ignored.
// Throws std::invalid_argument on malformed JSON or mistyped values.
void applyConfigJson(EngineConfig& config, const std::string& text);
std::string configToJson(const EngineConfig& config);

// Writes everything except the API key, owner-only permissions
bool saveConfigFile(const EngineConfig& config, std::string& error_message);

// Keyring first, then GEMINI_API_KEY, then ~/.config/ut/api_key
std::string lookupApiKey();

std::string getFromKeyring(const std::string& type);
bool storeInKeyring(const std::string& type, const std::string& value,
                    const std::string& label, std::string& error_message);

} // namespace ut

/**
 * Config.cpp - Engine configuration, config file and keyring credentials
 */

#include "ut/Config.hpp"

#include <nlohmann/json.hpp>
#include <libsecret/secret.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ut {

namespace {

// libsecret schema for storing credentials
const SecretSchema UT_API_SCHEMA = {
    "com.unifiedterminal.credentials",
    SECRET_SCHEMA_NONE,
    {
        {"type", SECRET_SCHEMA_ATTRIBUTE_STRING},
        {NULL, SECRET_SCHEMA_ATTRIBUTE_STRING}
    }
};

std::string homeDirectory() {
    const char* home = std::getenv("HOME");
    return (home != nullptr && *home != '\0') ? home : "/";
}

} // anonymous namespace

void EngineConfig::validate() const {
    if (resolver_timeout.count() <= 0) {
        throw std::invalid_argument("resolver_timeout_ms must be positive");
    }
    if (handler_timeout.count() <= 0) {
        throw std::invalid_argument("handler_timeout_ms must be positive");
    }
    if (session_idle_timeout.count() <= 0) {
        throw std::invalid_argument("session_idle_timeout_s must be positive");
    }
    if (model.empty()) {
        throw std::invalid_argument("model must not be empty");
    }
    if (!initial_directory.empty() && !fs::is_directory(initial_directory)) {
        throw std::invalid_argument("initial_directory is not a directory: " + initial_directory);
    }
}

std::string configDirectory() {
    return (fs::path(homeDirectory()) / ".config" / "ut").string();
}

std::string configFilePath() {
    return (fs::path(configDirectory()) / "config.json").string();
}

void applyConfigJson(EngineConfig& config, const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("malformed config: ") + e.what());
    }
    if (!doc.is_object()) {
        throw std::invalid_argument("malformed config: top level must be an object");
    }

    try {
        if (doc.contains("model")) config.model = doc["model"].get<std::string>();
        if (doc.contains("api_host")) config.api_host = doc["api_host"].get<std::string>();
        if (doc.contains("resolver_timeout_ms")) {
            config.resolver_timeout = std::chrono::milliseconds(doc["resolver_timeout_ms"].get<long long>());
        }
        if (doc.contains("handler_timeout_ms")) {
            config.handler_timeout = std::chrono::milliseconds(doc["handler_timeout_ms"].get<long long>());
        }
        if (doc.contains("session_idle_timeout_s")) {
            config.session_idle_timeout = std::chrono::seconds(doc["session_idle_timeout_s"].get<long long>());
        }
        if (doc.contains("initial_directory")) {
            config.initial_directory = doc["initial_directory"].get<std::string>();
        }
        if (doc.contains("offline")) config.offline = doc["offline"].get<bool>();
        if (doc.contains("log_level")) {
            std::string name = doc["log_level"].get<std::string>();
            if (!Logger::parseLevel(name, config.log_level)) {
                throw std::invalid_argument("unknown log_level: " + name);
            }
        }
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("malformed config: ") + e.what());
    }
}

std::string configToJson(const EngineConfig& config) {
    json doc = {
        {"model", config.model},
        {"api_host", config.api_host},
        {"resolver_timeout_ms", config.resolver_timeout.count()},
        {"handler_timeout_ms", config.handler_timeout.count()},
        {"session_idle_timeout_s", config.session_idle_timeout.count()},
        {"initial_directory", config.initial_directory},
        {"offline", config.offline},
        {"log_level", Logger::levelName(config.log_level)}
    };
    return doc.dump(2);
}

EngineConfig loadConfig() {
    EngineConfig config;

    std::string path = configFilePath();
    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        try {
            applyConfigJson(config, buffer.str());
        } catch (const std::invalid_argument& e) {
            Logger::warning("config", path + ": " + e.what() + " (using defaults)");
            config = EngineConfig();
        }
    }

    config.api_key = lookupApiKey();
    return config;
}

bool saveConfigFile(const EngineConfig& config, std::string& error_message) {
    std::error_code ec;
    fs::create_directories(configDirectory(), ec);
    if (ec) {
        error_message = "cannot create " + configDirectory() + ": " + ec.message();
        return false;
    }

    std::string path = configFilePath();
    {
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            error_message = "cannot write " + path;
            return false;
        }
        file << configToJson(config) << "\n";
    }

    if (chmod(path.c_str(), S_IRUSR | S_IWUSR) != 0) {
        error_message = "cannot restrict permissions on " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

std::string getFromKeyring(const std::string& type) {
    GError* error = nullptr;
    gchar* value = secret_password_lookup_sync(
        &UT_API_SCHEMA,
        nullptr,
        &error,
        "type", type.c_str(),
        NULL
    );

    if (error != nullptr) {
        Logger::debug("config", std::string("keyring lookup failed: ") + error->message);
        g_error_free(error);
        return "";
    }

    if (value == nullptr) {
        return "";
    }

    std::string result(value);
    secret_password_free(value);
    return result;
}

bool storeInKeyring(const std::string& type, const std::string& value,
                    const std::string& label, std::string& error_message) {
    GError* error = nullptr;
    gboolean success = secret_password_store_sync(
        &UT_API_SCHEMA,
        SECRET_COLLECTION_DEFAULT,
        label.c_str(),
        value.c_str(),
        nullptr,
        &error,
        "type", type.c_str(),
        NULL
    );

    if (error != nullptr) {
        error_message = error->message;
        g_error_free(error);
        return false;
    }

    return success == TRUE;
}

std::string lookupApiKey() {
    // 1. Keyring
    std::string key = getFromKeyring("api_key");
    if (!key.empty()) {
        return key;
    }

    // 2. Environment variable
    const char* env_key = std::getenv("GEMINI_API_KEY");
    if (env_key && strlen(env_key) > 0) {
        return env_key;
    }

    // 3. Plain file fallback
    fs::path key_path = fs::path(configDirectory()) / "api_key";
    std::error_code ec;
    if (fs::exists(key_path, ec)) {
        std::ifstream file(key_path);
        std::getline(file, key);
        if (!key.empty()) {
            return key;
        }
    }

    return "";
}

} // namespace ut

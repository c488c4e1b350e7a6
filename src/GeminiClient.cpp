/**
 * GeminiClient.cpp - HTTPS client for the Gemini API
 *
 * Uses cpp-httplib for HTTPS requests to the Gemini API. One SSL client is
 * created per request so translations for different sessions can run
 * concurrently.
 */

#include "ut/GeminiClient.hpp"
#include "ut/Log.hpp"
#include "ut/Result.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ut {

static const std::string GEMINI_API_BASE = "generativelanguage.googleapis.com";
static const std::string DEFAULT_MODEL = "gemini-2.0-flash";

struct GeminiClient::Impl {
    std::string api_key;
    std::string model;
    std::string host;
    std::chrono::milliseconds timeout;

    Impl(const std::string& key, const std::string& model_name, const std::string& host_name,
         std::chrono::milliseconds request_timeout)
        : api_key(key),
          model(model_name.empty() ? DEFAULT_MODEL : model_name),
          host(host_name.empty() ? GEMINI_API_BASE : host_name),
          timeout(request_timeout) {}

    std::string buildEndpoint() const {
        return "/v1beta/models/" + model + ":generateContent";
    }

    GeminiResponse sendRequest(const std::string& prompt) {
        GeminiResponse response;

        json contents = json::array();
        contents.push_back({
            {"role", "user"},
            {"parts", {{{"text", prompt}}}}
        });

        json request_body = {
            {"contents", contents},
            {"generationConfig", {{"temperature", 0}}}
        };

        httplib::SSLClient client(host);
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);

        httplib::Headers headers = {{"x-goog-api-key", api_key}};
        auto res = client.Post(buildEndpoint(), headers, request_body.dump(), "application/json");

        if (!res) {
            response.success = false;
            response.error = "Network error: " + httplib::to_string(res.error());
            return response;
        }

        if (res->status != 200) {
            response.success = false;
            response.error = "API error: HTTP " + std::to_string(res->status);
            try {
                json error_json = json::parse(res->body);
                if (error_json.contains("error") && error_json["error"].contains("message")) {
                    response.error += " - " + error_json["error"]["message"].get<std::string>();
                }
            } catch (const json::exception&) {
                // body was not JSON; the status line says enough
            }
            return response;
        }

        return parseResponseBody(res->body);
    }
};

GeminiClient::GeminiClient(const std::string& api_key, const std::string& model,
                           const std::string& host, std::chrono::milliseconds timeout)
    : impl_(std::make_unique<Impl>(api_key, model, host, timeout)) {}

GeminiClient::~GeminiClient() = default;

std::string GeminiClient::getDefaultModel() {
    return DEFAULT_MODEL;
}

std::string GeminiClient::getDefaultHost() {
    return GEMINI_API_BASE;
}

GeminiResponse GeminiClient::parseResponseBody(const std::string& body) {
    GeminiResponse response;

    try {
        json res_json = json::parse(body);

        if (res_json.contains("candidates") &&
            !res_json["candidates"].empty() &&
            res_json["candidates"][0].contains("content") &&
            res_json["candidates"][0]["content"].contains("parts") &&
            !res_json["candidates"][0]["content"]["parts"].empty() &&
            res_json["candidates"][0]["content"]["parts"][0].contains("text")) {

            response.content = res_json["candidates"][0]["content"]["parts"][0]["text"].get<std::string>();
            response.success = true;
        } else {
            response.success = false;
            response.error = "Invalid response structure";
        }
    } catch (const std::exception& e) {
        response.success = false;
        response.error = std::string("JSON parse error: ") + e.what();
    }

    return response;
}

GeminiResponse GeminiClient::generateContent(const std::string& prompt) {
    return impl_->sendRequest(prompt);
}

bool GeminiClient::validate(std::string& error_message) {
    auto response = impl_->sendRequest("Respond with only the word OK");
    if (!response.success) {
        error_message = response.error;
        return false;
    }
    return true;
}

TranslationReply GeminiClient::translate(const TranslationRequest& request) {
    Logger::debug("gemini", "translating via " + impl_->model);

    auto response = impl_->sendRequest(buildTranslationPrompt(request));
    if (!response.success) {
        throw TransportError(response.error);
    }

    TranslationReply reply;
    reply.command_line = response.content;
    return reply;
}

} // namespace ut

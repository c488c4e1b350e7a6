/**
 * GeminiClient.hpp - HTTPS client for the Gemini API
 */

#pragma once

#include "ut/Translation.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace ut {

struct GeminiResponse {
    std::string content;
    bool success = false;
    std::string error;
};

class GeminiClient : public TranslationBackend {
public:
    GeminiClient(const std::string& api_key, const std::string& model = "",
                 const std::string& host = "",
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(15000));
    ~GeminiClient() override;

    TranslationReply translate(const TranslationRequest& request) override;
    std::string name() const override { return "gemini"; }

    GeminiResponse generateContent(const std::string& prompt);

    // Validate API key and model by making a test request
    bool validate(std::string& error_message);

    // Pulls candidates[0].content.parts[0].text out of a generateContent body
    static GeminiResponse parseResponseBody(const std::string& body);

    static std::string getDefaultModel();
    static std::string getDefaultHost();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ut

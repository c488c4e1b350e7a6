/**
 * test_gemini_client.cpp - Unit tests for reply parsing and prompt building
 *
 * Nothing here touches the network.
 */

#include "ut/CommandRegistry.hpp"
#include "ut/GeminiClient.hpp"
#include "ut/Translation.hpp"

#include <cassert>
#include <iostream>

void test_parse_well_formed_body() {
    auto response = ut::GeminiClient::parseResponseBody(R"({
        "candidates": [
            {"content": {"role": "model", "parts": [{"text": "mkdir reports"}]}}
        ]
    })");

    assert(response.success);
    assert(response.content == "mkdir reports");
    assert(response.error.empty());

    std::cout << "[PASS] test_parse_well_formed_body\n";
}

void test_parse_empty_candidates() {
    auto response = ut::GeminiClient::parseResponseBody(R"({"candidates": []})");
    assert(!response.success);
    assert(response.content.empty());
    assert(response.error == "Invalid response structure");

    // Blocked prompts come back with no candidates at all
    response = ut::GeminiClient::parseResponseBody(R"({"promptFeedback": {"blockReason": "SAFETY"}})");
    assert(!response.success);
    assert(response.error == "Invalid response structure");

    std::cout << "[PASS] test_parse_empty_candidates\n";
}

void test_parse_part_without_text() {
    auto response = ut::GeminiClient::parseResponseBody(R"({
        "candidates": [{"content": {"parts": [{"inlineData": {"mimeType": "image/png"}}]}}]
    })");
    assert(!response.success);
    assert(response.content.empty());

    response = ut::GeminiClient::parseResponseBody(R"({"candidates": [{"content": {"parts": []}}]})");
    assert(!response.success);

    // text present but not a string
    response = ut::GeminiClient::parseResponseBody(R"({"candidates": [{"content": {"parts": [{"text": 42}]}}]})");
    assert(!response.success);
    assert(response.error.find("JSON parse error") == 0);

    std::cout << "[PASS] test_parse_part_without_text\n";
}

void test_parse_non_json() {
    auto response = ut::GeminiClient::parseResponseBody("<html>502 Bad Gateway</html>");
    assert(!response.success);
    assert(response.error.find("JSON parse error") == 0);

    response = ut::GeminiClient::parseResponseBody("");
    assert(!response.success);

    response = ut::GeminiClient::parseResponseBody(R"(["candidates"])");
    assert(!response.success);

    std::cout << "[PASS] test_parse_non_json\n";
}

void test_prompt_lists_every_command() {
    auto registry = ut::CommandRegistry::withDefaults();

    ut::TranslationRequest request;
    request.text = "show me what is using the most memory";
    request.commands = registry->canonicalNames();
    assert(!request.commands.empty());

    std::string prompt = ut::buildTranslationPrompt(request);

    for (const auto& name : request.commands) {
        assert(prompt.find(name) != std::string::npos);
    }
    assert(prompt.find("Supported commands: " + request.commands.front()) != std::string::npos);
    assert(prompt.find("\"" + request.text + "\"") != std::string::npos);
    assert(prompt.find("single line") != std::string::npos);

    std::cout << "[PASS] test_prompt_lists_every_command\n";
}

void test_default_endpoint() {
    assert(ut::GeminiClient::getDefaultModel() == "gemini-2.0-flash");
    assert(ut::GeminiClient::getDefaultHost() == "generativelanguage.googleapis.com");

    std::cout << "[PASS] test_default_endpoint\n";
}

int main() {
    std::cout << "Running GeminiClient tests...\n\n";

    test_parse_well_formed_body();
    test_parse_empty_candidates();
    test_parse_part_without_text();
    test_parse_non_json();
    test_prompt_lists_every_command();
    test_default_endpoint();

    std::cout << "\nAll tests passed!\n";
    return 0;
}

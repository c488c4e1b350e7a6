/**
 * Translation.hpp - Boundary to the external natural-language resolver
 */

#pragma once

#include <string>
#include <vector>

namespace ut {

struct TranslationRequest {
    std::string text;
    std::vector<std::string> commands;  // canonical names the reply must use
};

struct TranslationReply {
    std::string command_line;
};

class TranslationBackend {
public:
    virtual ~TranslationBackend() = default;

    // Throws TransportError when the service cannot be reached or answers garbage.
    // An empty command_line means "no translation".
    virtual TranslationReply translate(const TranslationRequest& request) = 0;

    virtual std::string name() const = 0;
};

std::string buildTranslationPrompt(const TranslationRequest& request);

} // namespace ut

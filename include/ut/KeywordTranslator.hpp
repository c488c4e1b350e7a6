/**
 * KeywordTranslator.hpp - Offline rule-based request translation
 */

#pragma once

#include "ut/Translation.hpp"

#include <memory>
#include <string>

namespace ut {

// Matches action/object keywords ("create" + "folder") and pulls names out of
// the request. Used when no language model is configured.
class KeywordTranslator : public TranslationBackend {
public:
    KeywordTranslator();
    ~KeywordTranslator() override;

    TranslationReply translate(const TranslationRequest& request) override;
    std::string name() const override { return "keywords"; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ut

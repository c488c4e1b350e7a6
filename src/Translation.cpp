/**
 * Translation.cpp - Prompt sent to the external natural-language resolver
 */

#include "ut/Translation.hpp"

#include <sstream>

namespace ut {

std::string buildTranslationPrompt(const TranslationRequest& request) {
    std::ostringstream prompt;
    prompt << "Convert this natural language request into exactly one terminal command.\n"
           << "Supported commands: ";
    for (size_t i = 0; i < request.commands.size(); ++i) {
        if (i > 0) prompt << ", ";
        prompt << request.commands[i];
    }
    prompt << "\n\n"
           << "Request: \"" << request.text << "\"\n\n"
           << "Rules:\n"
           << "- Reply with the command line only, on a single line\n"
           << "- The first word MUST be one of the supported commands\n"
           << "- No pipes, no redirection, no ';' or '&&', no explanation\n"
           << "- Paths are relative to the current directory unless given otherwise\n"
           << "- Quote arguments that contain spaces\n\n"
           << "Examples:\n"
           << "\"list files in current directory\" -> dir\n"
           << "\"create a folder called test\" -> mkdir test\n"
           << "\"delete the file hello.txt\" -> del hello.txt\n"
           << "\"copy file.txt to backup\" -> copy file.txt backup\n"
           << "\"rename old.txt to new.txt\" -> ren old.txt new.txt\n"
           << "\"show contents of notes.txt\" -> type notes.txt\n"
           << "\"show all running processes\" -> tasklist\n"
           << "\"kill process with id 1234\" -> taskkill /pid 1234\n"
           << "\"check memory usage\" -> mem\n"
           << "\"ping google.com\" -> ping google.com\n\n"
           << "CRITICAL: No markdown, no backticks, no quotes around the whole command.";
    return prompt.str();
}

} // namespace ut

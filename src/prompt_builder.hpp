#pragma once
#include "notes_store.hpp"
#include <string>
#include <optional>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace notehook {

// A mandatory fragment is missing
class PromptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PromptBuilder {
public:
    PromptBuilder(std::string prompts_dir, const NotesStore& notes);

    // prompts/<name>.md, nullopt if absent
    std::optional<std::string> read_fragment(const std::string& name) const;

    // Like read_fragment, but a missing fragment is a PromptError
    std::string require_fragment(const std::string& name) const;

    // preamble + optional mode fragment + note listing + <env> block,
    // returned as a one-element array of prompt chunks.
    nlohmann::json build_system_prompt(const std::optional<std::string>& mode = std::nullopt) const;

    static std::string env_block(std::chrono::system_clock::time_point now);

private:
    std::string prompts_dir_;
    const NotesStore& notes_;
};

} // namespace notehook

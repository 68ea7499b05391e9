#include "prompt_builder.hpp"

namespace notehook {

PromptBuilder::PromptBuilder(std::string prompts_dir, const NotesStore& notes)
    : prompts_dir_(std::move(prompts_dir))
    , notes_(notes)
{}

std::optional<std::string> PromptBuilder::read_fragment(const std::string& name) const {
    auto path = fs::path(prompts_dir_) / (name + ".md");
    if (!fs::is_regular_file(path)) return std::nullopt;
    return read_file(path.string());
}

std::string PromptBuilder::require_fragment(const std::string& name) const {
    auto text = read_fragment(name);
    if (!text) {
        throw PromptError("prompt fragment not found: " + (fs::path(prompts_dir_) / (name + ".md")).string());
    }
    return *text;
}

std::string PromptBuilder::env_block(std::chrono::system_clock::time_point now) {
    return "\n<env>\nSession start time: " + utc_timestamp_str(now) + "\n</env>\n";
}

nlohmann::json PromptBuilder::build_system_prompt(const std::optional<std::string>& mode) const {
    std::string prompt = require_fragment("preamble");
    if (mode) {
        prompt += require_fragment(*mode);
    }

    auto names = notes_.list();
    if (!names.empty()) {
        prompt += "\ncurrent notes: " + join(names) + "\n";
    }

    prompt += env_block(std::chrono::system_clock::now());
    return nlohmann::json::array({prompt});
}

} // namespace notehook

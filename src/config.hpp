#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace notehook {

struct Config {
    std::string workspace = ".";
    std::string notes_dir = "traits";     // one file per note
    std::string prompts_dir = "prompts";  // <name>.md fragments

    // Derived helpers (relative dirs resolve against the workspace)
    std::string notes_path() const { return resolve(notes_dir); }
    std::string prompts_path() const { return resolve(prompts_dir); }
    std::string config_file() const { return workspace + "/config/evolve.jsonc"; }

    // Reads <workspace>/config/evolve.jsonc on top of the defaults.
    // Missing file is silent; a malformed one warns and keeps the defaults.
    static Config load(const std::string& workspace);
    static Config from_json(const nlohmann::json& j, Config base);

private:
    std::string resolve(const std::string& dir) const;
};

// Workspace root: $OPENCODE_EVOLVE_WORKSPACE, $OPENCODE_SIDECAR_WORKSPACE,
// else the parent of the directory holding the executable (<ws>/hooks/<exe>).
std::string resolve_workspace(const char* argv0);

// Removes // and /* */ comments outside of string literals
std::string strip_json_comments(const std::string& text);

} // namespace notehook

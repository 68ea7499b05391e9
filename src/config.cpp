#include "config.hpp"
#include <cstdlib>
#include <iostream>

namespace notehook {

std::string Config::resolve(const std::string& dir) const {
    fs::path p(dir);
    if (p.is_absolute()) return p.string();
    return (fs::path(workspace) / p).string();
}

std::string strip_json_comments(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_string = false;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (in_string) {
            out += c;
            if (c == '\\' && i + 1 < text.size()) {
                out += text[i + 1];
                i += 2;
                continue;
            }
            if (c == '"') in_string = false;
            ++i;
        } else if (c == '"') {
            in_string = true;
            out += c;
            ++i;
        } else if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
            while (i < text.size() && text[i] != '\n') ++i;
        } else if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            auto end = text.find("*/", i + 2);
            i = (end == std::string::npos) ? text.size() : end + 2;
        } else {
            out += c;
            ++i;
        }
    }
    return out;
}

Config Config::from_json(const nlohmann::json& j, Config base) {
    // The file is shared with the host plugin; unknown keys are its business.
    base.notes_dir = j.value("notes_dir", base.notes_dir);
    base.prompts_dir = j.value("prompts_dir", base.prompts_dir);
    return base;
}

Config Config::load(const std::string& workspace) {
    Config c;
    c.workspace = workspace;

    std::error_code ec;
    if (!fs::exists(c.config_file(), ec)) return c;

    auto text = read_file(c.config_file());
    if (!text) {
        std::cerr << "[config] Cannot read " << c.config_file() << ", using defaults\n";
        return c;
    }
    try {
        auto j = nlohmann::json::parse(strip_json_comments(*text));
        if (!j.is_object()) {
            std::cerr << "[config] " << c.config_file() << " is not an object, using defaults\n";
            return c;
        }
        return from_json(j, c);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[config] Failed to parse config: " << e.what() << ", using defaults\n";
        return c;
    }
}

std::string resolve_workspace(const char* argv0) {
    for (auto var : {"OPENCODE_EVOLVE_WORKSPACE", "OPENCODE_SIDECAR_WORKSPACE"}) {
        const char* v = std::getenv(var);
        if (v && *v) return v;
    }

    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        exe = fs::weakly_canonical(fs::absolute(argv0 ? argv0 : ".", ec), ec);
    }
    return exe.parent_path().parent_path().string();
}

} // namespace notehook

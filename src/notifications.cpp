#include "notifications.hpp"
#include "utils.hpp"
#include <set>
#include <vector>

namespace notehook {

nlohmann::json make_change_notification(const std::string& file) {
    return {{"type", NOTE_CHANGED}, {"files", nlohmann::json::array({file})}};
}

std::optional<std::string> aggregate_notifications(const nlohmann::json& notifications) {
    if (!notifications.is_array()) return std::nullopt;

    std::set<std::string> changed;
    for (auto& n : notifications) {
        if (!n.is_object()) continue;
        auto type = n.find("type");
        if (type == n.end() || *type != NOTE_CHANGED) continue;
        auto files = n.find("files");
        if (files == n.end() || !files->is_array()) continue;
        for (auto& f : *files) {
            if (f.is_string()) changed.insert(f.get<std::string>());
        }
    }
    if (changed.empty()) return std::nullopt;

    std::vector<std::string> sorted(changed.begin(), changed.end());
    return "[note-update] changed: " + join(sorted);
}

} // namespace notehook

#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace notehook {

inline constexpr const char* NOTE_CHANGED = "note_changed";

// {type: "note_changed", files: [name]}
nlohmann::json make_change_notification(const std::string& file);

// Collapses the note_changed events into "[note-update] changed: a.md, b.md"
// (files deduplicated and sorted). nullopt when no file changed; a null or
// non-array `notifications` counts as empty.
std::optional<std::string> aggregate_notifications(const nlohmann::json& notifications);

} // namespace notehook

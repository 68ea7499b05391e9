#pragma once
#include "../tool_registry.hpp"
#include "../notes_store.hpp"
#include <memory>

namespace notehook {
// note_list, note_read, note_write, note_delete, note_patch
void register_note_tools(ToolRegistry& reg, std::shared_ptr<NotesStore> store);
} // namespace notehook

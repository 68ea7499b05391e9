#include "note_tools.hpp"
#include "../notifications.hpp"

namespace notehook {

static const char* NAME_DESC = "note filename (e.g. todo.md)";

// Result of a mutating tool: the changed name is reported so the host can
// queue a notification for other sessions.
static HookResult changed_result(const std::string& message, const std::string& name) {
    return {
        {"result", message},
        {"modified", nlohmann::json::array({name})},
        {"notify", nlohmann::json::array({make_change_notification(name)})}
    };
}

static HookResult plain_result(const std::string& message) {
    return {{"result", message}};
}

void register_note_tools(ToolRegistry& reg, std::shared_ptr<NotesStore> store) {
    // ── note_list ──
    {
        ToolDef def;
        def.name = "note_list";
        def.description = "list all notes";
        def.func = [store](const ToolArgs&) -> HookResult {
            auto names = store->list();
            if (names.empty()) return plain_result("no notes yet");
            return plain_result("notes: " + join(names));
        };
        reg.register_tool(std::move(def));
    }

    // ── note_read ──
    {
        ToolDef def;
        def.name = "note_read";
        def.description = "read a note";
        def.parameters = {{"name", NAME_DESC}};
        def.func = [store](const ToolArgs& args) -> HookResult {
            auto& name = args.at("name");
            auto content = store->read(name);
            if (!content) return plain_result("not found: " + name);
            return plain_result(*content);
        };
        reg.register_tool(std::move(def));
    }

    // ── note_write ──
    {
        ToolDef def;
        def.name = "note_write";
        def.description = "write a note";
        def.parameters = {
            {"name", NAME_DESC},
            {"content", "full content for the note"},
        };
        def.func = [store](const ToolArgs& args) -> HookResult {
            auto& name = args.at("name");
            store->write(name, args.at("content"));
            return changed_result("wrote " + name, name);
        };
        reg.register_tool(std::move(def));
    }

    // ── note_delete ──
    {
        ToolDef def;
        def.name = "note_delete";
        def.description = "delete a note";
        def.parameters = {{"name", NAME_DESC}};
        def.func = [store](const ToolArgs& args) -> HookResult {
            auto& name = args.at("name");
            if (!store->remove(name)) return plain_result("not found: " + name);
            return changed_result("deleted " + name, name);
        };
        reg.register_tool(std::move(def));
    }

    // ── note_patch ──
    // Single find-and-replace; zero or ambiguous matches leave the note untouched.
    {
        ToolDef def;
        def.name = "note_patch";
        def.description = "replace one exact occurrence of text in a note";
        def.parameters = {
            {"name", NAME_DESC},
            {"old_string", "the text to replace"},
            {"new_string", "the new text to replace with"},
        };
        def.func = [store](const ToolArgs& args) -> HookResult {
            auto& name = args.at("name");
            auto& old_string = args.at("old_string");
            auto content = store->read(name);
            if (!content) return plain_result("not found: " + name);
            if (old_string.empty()) return plain_result("failed: old_string is empty");

            int matches = 0;
            size_t first = std::string::npos;
            for (size_t pos = content->find(old_string); pos != std::string::npos;
                 pos = content->find(old_string, pos + old_string.size())) {
                if (matches == 0) first = pos;
                ++matches;
            }
            if (matches == 0) return plain_result("failed: old_string not found");
            if (matches > 1) {
                return plain_result("failed: " + std::to_string(matches) +
                                    " matches for old_string, expected 1");
            }

            content->replace(first, old_string.size(), args.at("new_string"));
            store->write(name, *content);
            return changed_result("patched " + name, name);
        };
        reg.register_tool(std::move(def));
    }
}

} // namespace notehook

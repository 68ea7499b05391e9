#pragma once
#include "hooks.hpp"
#include "tool_registry.hpp"
#include "notes_store.hpp"
#include "prompt_builder.hpp"
#include "frame_writer.hpp"

namespace notehook {

// Collaborators the hook handlers close over
struct HookEnv {
    NotesStore& notes;
    const PromptBuilder& prompts;
    const ToolRegistry& tools;
    FrameWriter& out;
};

// discover, mutate_request, format_notification, observe_message, idle,
// heartbeat, recover, tool_before, tool_after, compacting, execute_tool
void register_lifecycle_hooks(HookRegistry& hooks, const HookEnv& env);

// Fixed output of the recover hook
inline constexpr const char* RECOVERY_NOTICE = "system recovery - an error occurred";
inline constexpr const char* RECOVERY_INSTRUCTION = "please check notes and continue";

} // namespace notehook

#pragma once
#include "config.hpp"
#include "frame_writer.hpp"
#include "notes_store.hpp"
#include "prompt_builder.hpp"
#include "tool_registry.hpp"
#include "hooks.hpp"
#include <memory>
#include <ostream>
#include <istream>

namespace notehook {

// One invocation's worth of state: registries populated, collaborators wired.
class Runtime {
public:
    Runtime(const Config& config, std::ostream& out);
    // Hook closures hold references into this object
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // Process contract for `<exe> <hook_name>`; returns the exit code
    int run(const std::string& hook_name, std::istream& in);

    const HookRegistry& hooks() const { return hooks_; }

private:
    FrameWriter out_;
    std::shared_ptr<NotesStore> notes_;
    PromptBuilder prompts_;
    ToolRegistry tools_;
    HookRegistry hooks_;
};

// Command-line entry: `argv[1]` names the hook. Without it, emits a usage
// error and returns 1 without touching `in`.
int run_cli(int argc, char* argv[], std::istream& in, std::ostream& out);

} // namespace notehook

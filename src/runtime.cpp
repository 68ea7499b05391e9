#include "runtime.hpp"
#include "dispatcher.hpp"
#include "lifecycle_hooks.hpp"
#include "tools/note_tools.hpp"

namespace notehook {

Runtime::Runtime(const Config& config, std::ostream& out)
    : out_(out)
    , notes_(std::make_shared<NotesStore>(config.notes_path()))
    , prompts_(config.prompts_path(), *notes_)
{
    register_note_tools(tools_, notes_);
    register_lifecycle_hooks(hooks_, HookEnv{*notes_, prompts_, tools_, out_});
}

int Runtime::run(const std::string& hook_name, std::istream& in) {
    return dispatch(hooks_, out_, hook_name, in);
}

int run_cli(int argc, char* argv[], std::istream& in, std::ostream& out) {
    FrameWriter writer(out);
    if (argc < 2) {
        writer.emit("error", "usage: notehook <hook_name>");
        return 1;
    }

    try {
        auto config = Config::load(resolve_workspace(argv[0]));
        Runtime runtime(config, out);
        return runtime.run(argv[1], in);
    } catch (const std::exception& e) {
        writer.emit("error", std::string("startup failed: ") + e.what());
        return 1;
    }
}

} // namespace notehook

#include "dispatcher.hpp"
#include "utils.hpp"
#include <iterator>

namespace notehook {

HookContext parse_context(const std::string& input) {
    if (is_blank(input)) return HookContext::object();
    auto ctx = nlohmann::json::parse(input, nullptr, /*allow_exceptions=*/false);
    if (ctx.is_discarded() || !ctx.is_object()) return HookContext::object();
    return ctx;
}

int dispatch(const HookRegistry& hooks, FrameWriter& out,
             const std::string& hook_name, std::istream& in) {
    const HookEntry* entry = hooks.resolve(hook_name);
    if (!entry) {
        out.emit("error", "unknown hook: " + hook_name);
        return 1;
    }

    std::string input{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    HookContext ctx = parse_context(input);

    HookOutcome outcome = run_guarded(*entry, ctx);
    if (!outcome.ok) {
        out.log(hook_name + ": " + outcome.error);
        out.emit("error", outcome.error);
        return 0;
    }

    HookResult frames = HookResult::object();
    for (auto& [key, value] : outcome.result.items()) {
        if (!is_result_key(key)) {
            out.log(hook_name + ": dropping unrecognized result key '" + key + "'");
            continue;
        }
        frames[key] = value;
    }
    out.emit_result(frames);
    return 0;
}

} // namespace notehook

#include "hooks.hpp"

namespace notehook {

HookOutcome HookOutcome::success(HookResult result) {
    HookOutcome o;
    o.result = std::move(result);
    return o;
}

HookOutcome HookOutcome::failure(std::string error) {
    HookOutcome o;
    o.ok = false;
    o.error = std::move(error);
    return o;
}

void HookRegistry::register_hook(HookEntry entry) {
    auto name = entry.name;
    hooks_[name] = std::move(entry);
}

const HookEntry* HookRegistry::resolve(const std::string& name) const {
    auto it = hooks_.find(name);
    if (it == hooks_.end()) return nullptr;
    return &it->second;
}

bool HookRegistry::has(const std::string& name) const {
    return hooks_.count(name) > 0;
}

int HookRegistry::hook_count() const {
    return static_cast<int>(hooks_.size());
}

HookOutcome run_guarded(const HookEntry& entry, const HookContext& ctx) {
    if (!entry.callback) {
        return HookOutcome::failure("hook '" + entry.name + "' has no handler");
    }
    try {
        HookResult result = entry.callback(ctx);
        if (result.is_null()) result = HookResult::object();
        if (!result.is_object()) {
            return HookOutcome::failure("hook '" + entry.name + "' returned a non-object result");
        }
        return HookOutcome::success(std::move(result));
    } catch (const std::exception& e) {
        return HookOutcome::failure(e.what());
    } catch (...) {
        return HookOutcome::failure("hook '" + entry.name + "' threw a non-standard exception");
    }
}

} // namespace notehook

#pragma once
#include <string>
#include <map>
#include <set>
#include <functional>
#include <nlohmann/json.hpp>

namespace notehook {

// Host-supplied, read-only; schema varies per hook
using HookContext = nlohmann::json;
// Object keyed by the recognized result keys below
using HookResult = nlohmann::json;
using HookCallback = std::function<HookResult(const HookContext&)>;

// Every key a hook may put on the wire
inline const std::set<std::string>& result_keys() {
    static const std::set<std::string> keys = {
        "system", "tools", "user", "prompt", "message",
        "result", "actions", "modified", "notify", "error",
    };
    return keys;
}

inline bool is_result_key(const std::string& key) {
    return result_keys().count(key) > 0;
}

struct HookEntry {
    std::string name;
    HookCallback callback;
};

// Success payload or error message; the dispatcher branches on `ok`.
struct HookOutcome {
    bool ok = true;
    HookResult result = HookResult::object();
    std::string error;

    static HookOutcome success(HookResult result);
    static HookOutcome failure(std::string error);
};

class HookRegistry {
public:
    // Last registration for a name wins
    void register_hook(HookEntry entry);

    // nullptr when no hook has that name
    const HookEntry* resolve(const std::string& name) const;

    bool has(const std::string& name) const;
    int hook_count() const;

private:
    std::map<std::string, HookEntry> hooks_;
};

// Invokes the hook and converts anything it throws into a failed outcome.
HookOutcome run_guarded(const HookEntry& entry, const HookContext& ctx);

} // namespace notehook

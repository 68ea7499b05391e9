#include "lifecycle_hooks.hpp"
#include "notifications.hpp"
#include "utils.hpp"

namespace notehook {

// ctx[key], or null when absent; hosts add fields freely
static const nlohmann::json& field(const nlohmann::json& obj, const char* key) {
    static const nlohmann::json null_value;
    if (!obj.is_object()) return null_value;
    auto it = obj.find(key);
    return it == obj.end() ? null_value : *it;
}

// Printable form of a context value for log lines
static std::string show(const nlohmann::json& v, const std::string& fallback = "?") {
    if (v.is_null()) return fallback;
    if (v.is_string()) return v.get<std::string>();
    return v.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

static std::string bracket_list(const std::vector<std::string>& items) {
    return "[" + join(items) + "]";
}

static std::vector<std::string> keys_of(const nlohmann::json& obj) {
    std::vector<std::string> keys;
    if (!obj.is_object()) return keys;
    for (auto& [k, _] : obj.items()) keys.push_back(k);
    return keys;
}

void register_lifecycle_hooks(HookRegistry& hooks, const HookEnv& env) {
    auto add = [&hooks](const char* name, HookCallback cb) {
        hooks.register_hook(HookEntry{name, std::move(cb)});
    };

    // ── Tool discovery / prompt injection ───────────────────────────────

    add("discover", [env](const HookContext&) -> HookResult {
        auto defs = env.tools.tool_defs();
        env.out.log("tools: " + join(env.tools.tool_names()));
        return {{"tools", defs}};
    });

    add("mutate_request", [env](const HookContext&) -> HookResult {
        env.out.log("notes: " + join(env.notes.list()));
        return {{"system", env.prompts.build_system_prompt("chat")}};
    });

    add("format_notification", [](const HookContext& ctx) -> HookResult {
        auto message = aggregate_notifications(field(ctx, "notifications"));
        if (!message) return HookResult::object();
        return {{"message", *message}};
    });

    // ── Observation ─────────────────────────────────────────────────────

    add("observe_message", [env](const HookContext& ctx) -> HookResult {
        auto& session = field(ctx, "session");
        env.out.log("session=" + show(field(session, "id")) +
                    " agent=" + show(field(session, "agent")));
        return HookResult::object();
    });

    add("idle", [env](const HookContext& ctx) -> HookResult {
        auto& session = field(ctx, "session");
        auto& answer = field(ctx, "answer");
        size_t answer_len = answer.is_string() ? utf8_length(answer.get<std::string>()) : 0;
        env.out.log("session=" + show(field(session, "id")) +
                    " answer_len=" + std::to_string(answer_len));
        return HookResult::object();
    });

    // ── Periodic / recovery ─────────────────────────────────────────────

    add("heartbeat", [env](const HookContext&) -> HookResult {
        env.out.log("notes: " + join(env.notes.list()));
        auto user = env.prompts.read_fragment("heartbeat");
        if (!user) {
            env.out.log("heartbeat.md not found, skipping");
            return HookResult::object();
        }
        if (is_blank(*user)) {
            env.out.log("heartbeat prompt is empty, skipping");
            return HookResult::object();
        }
        return {
            {"system", env.prompts.build_system_prompt("heartbeat")},
            {"user", *user}
        };
    });

    // The failure detail goes to the log only, never into the result.
    add("recover", [env](const HookContext& ctx) -> HookResult {
        env.out.log("recovering from " + show(field(ctx, "failed_hook")) +
                    ": " + show(field(ctx, "error")));
        return {
            {"system", nlohmann::json::array({RECOVERY_NOTICE})},
            {"user", RECOVERY_INSTRUCTION}
        };
    });

    // Extension points
    add("tool_before", [](const HookContext&) -> HookResult { return HookResult::object(); });
    add("tool_after", [](const HookContext&) -> HookResult { return HookResult::object(); });

    add("compacting", [env](const HookContext&) -> HookResult {
        env.out.log("notes: " + join(env.notes.list()));
        auto prompt = env.prompts.read_fragment("compaction");
        if (!prompt) {
            env.out.log("compaction.md not found, skipping");
            return HookResult::object();
        }
        return {{"prompt", *prompt}};
    });

    // ── Tool execution ──────────────────────────────────────────────────

    add("execute_tool", [env](const HookContext& ctx) -> HookResult {
        auto& tool = field(ctx, "tool");
        std::string name = tool.is_string() ? tool.get<std::string>() : show(tool, "");
        const ToolDef* def = env.tools.resolve(name);
        if (!def) {
            env.out.log("unknown tool: " + name);
            return {{"result", "unknown tool: " + name}};
        }

        auto& args = field(ctx, "args");
        env.out.log("tool=" + name + " args=" + bracket_list(keys_of(args)));
        try {
            HookResult result = env.tools.invoke(*def, args);
            env.out.log("tool=" + name + " result keys=" + bracket_list(keys_of(result)));
            return result;
        } catch (const std::exception& e) {
            env.out.log("tool=" + name + " error: " + e.what());
            return {{"result", std::string("tool error: ") + e.what()}};
        }
    });
}

} // namespace notehook

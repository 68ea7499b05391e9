#pragma once
#include <string>
#include <map>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include "hooks.hpp"

namespace notehook {

// Bound keyword arguments, one per declared parameter
using ToolArgs = std::map<std::string, std::string>;
using ToolFunction = std::function<HookResult(const ToolArgs&)>;

// Raised when call arguments do not fit the declared parameters
class ToolArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct ToolParam {
    std::string name;
    std::string description;  // empty: callable but left out of the schema
};

struct ToolDef {
    std::string name;
    std::string description;
    std::vector<ToolParam> parameters;
    ToolFunction func;
};

class ToolRegistry {
public:
    void register_tool(ToolDef def) {
        if (!tools_.count(def.name)) order_.push_back(def.name);
        tools_[def.name] = std::move(def);
        spec_dirty_ = true;
    }

    // nullptr when no tool has that name
    const ToolDef* resolve(const std::string& name) const {
        auto it = tools_.find(name);
        return it == tools_.end() ? nullptr : &it->second;
    }

    // {name, description, parameters: {param: description}}; never calls the tool
    static nlohmann::json describe(const ToolDef& def) {
        nlohmann::json params = nlohmann::json::object();
        for (auto& p : def.parameters) {
            if (p.description.empty()) continue;
            params[p.name] = p.description;
        }
        return {
            {"name", def.name},
            {"description", def.description},
            {"parameters", params}
        };
    }

    // Schemas in registration order
    nlohmann::json tool_defs() const {
        if (!spec_dirty_) return cached_spec_;
        nlohmann::json arr = nlohmann::json::array();
        for (auto& name : order_) {
            arr.push_back(describe(tools_.at(name)));
        }
        cached_spec_ = std::move(arr);
        spec_dirty_ = false;
        return cached_spec_;
    }

    // Keyword-argument binding: every key must name a parameter, every
    // parameter must be present, and every value must be a string.
    static ToolArgs bind_arguments(const ToolDef& def, const nlohmann::json& args) {
        if (!args.is_null() && !args.is_object()) {
            throw ToolArgumentError(def.name + ": arguments must be an object");
        }
        ToolArgs bound;
        if (args.is_object()) {
            for (auto& [key, value] : args.items()) {
                bool declared = false;
                for (auto& p : def.parameters) {
                    if (p.name == key) { declared = true; break; }
                }
                if (!declared) {
                    throw ToolArgumentError(def.name + "() got an unexpected keyword argument '" + key + "'");
                }
                if (!value.is_string()) {
                    throw ToolArgumentError(def.name + "(): argument '" + key + "' must be a string");
                }
                bound[key] = value.get<std::string>();
            }
        }
        for (auto& p : def.parameters) {
            if (!bound.count(p.name)) {
                throw ToolArgumentError(def.name + "() missing required argument '" + p.name + "'");
            }
        }
        return bound;
    }

    HookResult invoke(const ToolDef& def, const nlohmann::json& args) const {
        HookResult result = def.func(bind_arguments(def, args));
        if (!result.is_object()) {
            throw std::runtime_error(def.name + " returned a non-object result");
        }
        return result;
    }

    std::vector<std::string> tool_names() const {
        return order_;
    }

private:
    std::map<std::string, ToolDef> tools_;
    std::vector<std::string> order_;
    mutable nlohmann::json cached_spec_;
    mutable bool spec_dirty_ = true;
};

} // namespace notehook

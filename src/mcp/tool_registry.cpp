#include <ea_mcp/mcp/tool_registry.hpp>

#include <ea_mcp/core/log.hpp>

namespace ea_mcp {

ToolResult MakeTextResult(const nlohmann::json& payload, bool is_error) {
    return ToolResult{
        is_error,
        nlohmann::json::array({{{"type", "text"}, {"text", payload.dump()}}})};
}

nlohmann::json ErrorToJson(const Error& error) {
    nlohmann::json j = {
        {"kind", error.KindName()},
        {"operation", error.operation},
        {"message", error.message},
    };
    if (error.field.has_value()) {
        j["field"] = *error.field;
    }
    if (error.index.has_value()) {
        j["index"] = *error.index;
    }
    if (error.value.has_value()) {
        j["value"] = *error.value;
    }
    if (!error.allowed.empty()) {
        j["allowed"] = error.allowed;
    }
    return j;
}

ToolResult MakeToolErrorResult(const Error& error, const nlohmann::json& extra) {
    nlohmann::json payload = {{"status", "error"}, {"error", ErrorToJson(error)}};
    if (extra.is_object()) {
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            payload[it.key()] = it.value();
        }
    }
    return MakeTextResult(payload, true);
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (handlers_.count(name) == 0) {
        schemas_.push_back({name, description, input_schema});
    } else {
        for (auto& schema : schemas_) {
            if (schema.name == name) {
                schema = ToolSchema{name, description, input_schema};
            }
        }
    }
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& params) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return MakeToolErrorResult(
            Error::InvalidParameter(name, "name", "unknown tool"));
    }

    LogInfo("mcp", "Executing tool: " + name);
    try {
        auto result = it->second(params);
        if (result.is_error) {
            LogWarn("mcp", "Tool " + name + " returned an error.");
        } else {
            LogInfo("mcp", "Tool " + name + " executed successfully.");
        }
        return result;
    } catch (const std::exception& e) {
        LogError("mcp", "Error in " + name + ": " + e.what());
        return MakeToolErrorResult(Error::Internal(name, e.what()));
    }
}

} // namespace ea_mcp

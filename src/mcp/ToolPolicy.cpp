#include "mcp/ToolPolicy.h"

nlohmann::json ToolDescriptor::toJson() const {
    nlohmann::json out = {{"name", name}, {"readOnly", readOnly}};
    if (!description.empty()) out["description"] = description;
    if (!inputSchema.is_null()) out["inputSchema"] = inputSchema;
    return out;
}

nlohmann::json ToolDescriptor::toFunctionSchema() const {
    nlohmann::json parameters = inputSchema.is_object()
        ? inputSchema
        : nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}};
    return {
        {"type", "function"},
        {"function", {
            {"name", name},
            {"description", description},
            {"parameters", parameters}
        }}
    };
}

ToolPolicy::ToolPolicy(const std::vector<std::string>& extraReadOnly)
    : extraReadOnly(extraReadOnly.begin(), extraReadOnly.end()) {}

const std::unordered_set<std::string>& ToolPolicy::builtinReadOnly() {
    static const std::unordered_set<std::string> names = {
        "list_files",
        "read_file",
        "search_files",
        "validate_script",
        "list_project_resources",
        "list_snapshots",
        "get_runtime_info"
    };
    return names;
}

bool ToolPolicy::isReadOnly(const std::string& name) const {
    return builtinReadOnly().count(name) > 0 || extraReadOnly.count(name) > 0;
}

bool ToolPolicy::isDirectoryTool(const std::string& name) const {
    return name == "list_files" || name == "search_files";
}

nlohmann::json ToolPolicy::normalizeArguments(const std::string& name, nlohmann::json args,
                                              const std::string& defaultRoot) const {
    if (!args.is_object()) {
        args = nlohmann::json::object();
    }
    if (!isDirectoryTool(name)) {
        return args;
    }

    auto it = args.find("path");
    bool missing = it == args.end() || it->is_null();
    if (!missing && it->is_string()) {
        const std::string path = it->get<std::string>();
        missing = path.empty() || path == "." || path == "./";
    }
    if (missing) {
        args["path"] = defaultRoot;
    }
    return args;
}

ToolDescriptor ToolPolicy::describe(const nlohmann::json& tool) const {
    ToolDescriptor descriptor;
    descriptor.name = tool.value("name", std::string());
    if (tool.contains("description") && tool["description"].is_string()) {
        descriptor.description = tool["description"].get<std::string>();
    }
    if (tool.contains("inputSchema")) {
        descriptor.inputSchema = tool["inputSchema"];
    }
    descriptor.readOnly = isReadOnly(descriptor.name);
    return descriptor;
}

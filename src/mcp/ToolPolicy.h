#pragma once
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json inputSchema;     // null when the server sent none
    bool readOnly = false;          // resolved once when the catalog is fetched

    nlohmann::json toJson() const;

    // OpenAI-style function-calling entry
    nlohmann::json toFunctionSchema() const;
};

/**
 * @brief 只读/可变工具划分
 *
 * 只读集合之外的一切 (写入、替换、恢复快照以及任何未知名称)
 * 都视为可变操作,永远不会自动执行。
 */
class ToolPolicy {
public:
    ToolPolicy() = default;
    explicit ToolPolicy(const std::vector<std::string>& extraReadOnly);

    static const std::unordered_set<std::string>& builtinReadOnly();

    bool isReadOnly(const std::string& name) const;

    // Tools whose "path" argument names a directory
    bool isDirectoryTool(const std::string& name) const;

    /**
     * Fills defaults the model tends to leave out: an empty, "." or "./"
     * path on a directory tool becomes defaultRoot.
     */
    nlohmann::json normalizeArguments(const std::string& name, nlohmann::json args,
                                      const std::string& defaultRoot) const;

    ToolDescriptor describe(const nlohmann::json& tool) const;

private:
    std::unordered_set<std::string> extraReadOnly;
};

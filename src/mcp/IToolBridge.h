#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/ToolPolicy.h"

// What the orchestrator needs from a tool server connection.
class IToolBridge {
public:
    virtual ~IToolBridge() = default;
    virtual bool isRunning() const = 0;
    virtual std::vector<ToolDescriptor> listTools() const = 0;

    // Unwrapped tool payload; throws ToolApplicationError for domain failures.
    virtual nlohmann::json callTool(const std::string& name, const nlohmann::json& arguments) = 0;
};

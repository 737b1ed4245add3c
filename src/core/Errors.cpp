#include "core/Errors.h"
#include <unordered_map>

nlohmann::json ToolApplicationError::toJson() const {
    nlohmann::json out = {
        {"code", code},
        {"message", what()}
    };
    if (!hint.empty()) out["hint"] = hint;
    if (!details.is_null()) out["details"] = details;
    return out;
}

int statusForToolErrorCode(const std::string& code) {
    static const std::unordered_map<std::string, int> codeMap = {
        {"E_NOT_FOUND", 404},
        {"E_BAD_ARGS", 400},
        {"E_CONFLICT", 409},
        {"E_TIMEOUT", 408},
        {"E_FORBIDDEN", 403},
        {"E_POLICY_VIOLATION", 403},
        {"E_TOO_LARGE", 413},
        {"E_ENCODING", 422},
        {"E_PARSE_FAIL", 422},
        {"E_LINT_FAIL", 422},
        {"E_TOOL_DISABLED", 503},
        {"E_PREVIEW_FAIL", 500},
        {"E_INTERNAL", 500},
        {"E_IO", 500}
    };
    auto it = codeMap.find(code);
    return it == codeMap.end() ? 500 : it->second;
}

int statusForTurnError(const std::exception& error) {
    if (dynamic_cast<const CredentialMissing*>(&error)) return 503;
    if (dynamic_cast<const GatewayPermanent*>(&error)) return 400;
    if (dynamic_cast<const GatewayTransient*>(&error)) return 502;
    if (auto* toolError = dynamic_cast<const ToolApplicationError*>(&error)) {
        return statusForToolErrorCode(toolError->getCode());
    }
    return 500;
}

nlohmann::json errorToJson(const std::exception& error) {
    if (auto* toolError = dynamic_cast<const ToolApplicationError*>(&error)) {
        return toolError->toJson();
    }

    std::string code = "E_INTERNAL";
    if (dynamic_cast<const ProtocolTimeout*>(&error)) {
        code = "E_TIMEOUT";
    } else if (dynamic_cast<const ProcessTerminated*>(&error)) {
        code = "E_PROCESS_TERMINATED";
    } else if (auto* rpcError = dynamic_cast<const RpcError*>(&error)) {
        nlohmann::json out = {
            {"code", "E_RPC"},
            {"message", rpcError->what()},
            {"rpcCode", rpcError->getCode()}
        };
        if (!rpcError->getData().is_null()) out["details"] = rpcError->getData();
        return out;
    }
    return {{"code", code}, {"message", error.what()}};
}

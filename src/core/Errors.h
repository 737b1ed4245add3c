#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Ferry 错误体系
 *
 * Bridge 与 Gateway 只抛出,不吞掉错误;由 Orchestrator 决定
 * 记录后继续 (单个 step 失败) 还是中止整个 turn (生成失败)。
 */
class FerryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No response within the per-call deadline. The process keeps running.
class ProtocolTimeout : public FerryError {
public:
    ProtocolTimeout(const std::string& method, long long elapsedMs)
        : FerryError("Request timeout: " + method + " (" + std::to_string(elapsedMs) + "ms)"),
          method(method) {}

    const std::string& getMethod() const { return method; }

private:
    std::string method;
};

// The child died, failed to start, or is not running.
class ProcessTerminated : public FerryError {
public:
    using FerryError::FerryError;
};

// JSON-RPC level error object returned by the server.
class RpcError : public FerryError {
public:
    RpcError(int code, const std::string& message, nlohmann::json data = nullptr)
        : FerryError(message), code(code), data(std::move(data)) {}

    int getCode() const { return code; }
    const nlohmann::json& getData() const { return data; }

private:
    int code;
    nlohmann::json data;
};

/**
 * @brief 工具已执行但报告了领域错误
 *
 * 唯一携带稳定错误码 (E_NOT_FOUND, E_BAD_ARGS, ...) 的类别,
 * 供边界层翻译成外部可见的状态。
 */
class ToolApplicationError : public FerryError {
public:
    ToolApplicationError(std::string code, const std::string& message,
                         std::string hint = "", nlohmann::json details = nullptr)
        : FerryError(message), code(std::move(code)), hint(std::move(hint)), details(std::move(details)) {}

    const std::string& getCode() const { return code; }
    const std::string& getHint() const { return hint; }
    const nlohmann::json& getDetails() const { return details; }

    nlohmann::json toJson() const;

private:
    std::string code;
    std::string hint;
    nlohmann::json details;
};

class GatewayError : public FerryError {
public:
    GatewayError(int status, const std::string& message)
        : FerryError(message), status(status) {}

    // 0 when no HTTP response was received
    int getStatus() const { return status; }

private:
    int status;
};

// 5xx, 429 or connection failure after local retries were exhausted.
class GatewayTransient : public GatewayError {
public:
    using GatewayError::GatewayError;
};

// Any other non-2xx response, or an unusable response body.
class GatewayPermanent : public GatewayError {
public:
    using GatewayError::GatewayError;
};

class CredentialMissing : public FerryError {
public:
    using FerryError::FerryError;
};

// HTTP-like status for a tool error code, 500 for unknown codes.
int statusForToolErrorCode(const std::string& code);

// HTTP-like status a boundary layer should report for a failed turn.
int statusForTurnError(const std::exception& error);

// Structured {code, message, hint?, details?} record for a step error.
nlohmann::json errorToJson(const std::exception& error);

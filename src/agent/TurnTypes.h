#pragma once
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/LLMGateway.h"

/**
 * @brief 单个工具调用在 turn 中的记录
 *
 * 按调用顺序产生。被拦截的可变操作只记录名称与参数,不执行。
 */
struct Step {
    std::string name;

    /**
     * @brief 解析后的参数 (格式错误时为 {})
     */
    nlohmann::json args = nlohmann::json::object();

    /**
     * @brief 是否因需要确认而未执行
     */
    bool blocked = false;
    std::string reason;

    /**
     * @brief 一行概括: 拦截提示、结果预览或错误信息
     */
    std::string summary;

    nlohmann::json result;   // null unless executed successfully
    nlohmann::json error;    // {code, message, hint?, details?} on failure
    long long durationMs = -1;

    bool succeeded() const { return !blocked && error.is_null(); }

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"name", name},
            {"args", args},
            {"blocked", blocked},
            {"summary", summary}
        };
        if (!reason.empty()) j["reason"] = reason;
        if (!result.is_null()) j["result"] = result;
        if (!error.is_null()) j["error"] = error;
        if (durationMs >= 0) j["durationMs"] = durationMs;
        return j;
    }
};

struct ChatRequest {
    std::string sessionId;   // empty: start a new session
    std::string message;
    std::string scenePath;   // optional editor context
};

struct ChatResponse {
    std::string sessionId;
    std::string content;
    std::vector<Step> steps;
    LLMUsage usage;
    int retryAttempts = 0;

    nlohmann::json toJson() const {
        nlohmann::json stepList = nlohmann::json::array();
        for (const auto& step : steps) {
            stepList.push_back(step.toJson());
        }
        return {
            {"sessionId", sessionId},
            {"role", "assistant"},
            {"content", content},
            {"steps", stepList},
            {"usage", usage.toJson()},
            {"retryAttempts", retryAttempts}
        };
    }
};

// One streaming event: meta, assistant, step, info, retry, final, error, done.
struct TurnEvent {
    std::string type;
    nlohmann::json data = nlohmann::json::object();
};

using TurnEventSink = std::function<void(const TurnEvent&)>;

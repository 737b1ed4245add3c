#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "agent/SessionStore.h"
#include "agent/ToolCallRetry.h"
#include "agent/TurnTypes.h"
#include "core/LLMGateway.h"
#include "mcp/IToolBridge.h"
#include "mcp/ToolPolicy.h"

struct OrchestratorOptions {
    int maxSteps = 12;
    size_t maxHistory = 12;
    RetryConfig retry;
    std::string systemPrompt;
    std::string defaultListRoot = "game";
};

/**
 * @brief 对话编排器 - 单个 turn 的状态机
 *
 * 会话 → 工具目录 → 生成 → 重试判定 → 分支 (直接回答 / 执行工具) → 汇总
 *
 * 安全划分:
 * 1. 只读工具自动执行,结果只保留有界预览
 * 2. 可变工具 (写入、替换、恢复快照、未知名称) 只记录为 blocked step,从不调用
 * 3. 单个 step 失败只记录,不中止 turn;生成阶段失败中止整个 turn
 */
class ConversationOrchestrator {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    ConversationOrchestrator(std::shared_ptr<LLMGateway> gateway,
                             IToolBridge& bridge,
                             std::shared_ptr<SessionStore> sessions,
                             OrchestratorOptions options = {},
                             ToolPolicy policy = {},
                             std::shared_ptr<ToolCallRetry> retry = nullptr);

    /**
     * @brief 同步执行一个 turn
     * 生成失败 (CredentialMissing / GatewayPermanent / GatewayTransient) 直接抛出
     */
    ChatResponse chat(const ChatRequest& request);

    /**
     * @brief 流式执行一个 turn
     *
     * 事件按发生顺序推送: meta, retry, assistant, info, step, final;
     * 失败时推送 error。无论成功与否,最后一个事件总是 done。
     *
     * sink 在持有该会话 turn 锁时被调用: sink 内不得对同一 sessionId
     * 发起新的 turn (会死锁),其它会话不受影响。
     */
    void chatStream(const ChatRequest& request, const TurnEventSink& sink);

    // Backoff between nudged regenerations; defaults to sleeping the calling thread.
    void setSleeper(Sleeper sleeper) { this->sleeper = std::move(sleeper); }

    static const std::string& blockedReason();

    // Arguments are model-produced text; anything but a JSON object degrades to {}.
    static nlohmann::json parseArguments(const std::string& raw);

    static std::string composeSummary(const std::string& preamble,
                                      const std::vector<Step>& steps,
                                      int retryAttempts);

private:
    std::shared_ptr<LLMGateway> gateway;
    IToolBridge& bridge;
    std::shared_ptr<SessionStore> sessions;
    OrchestratorOptions options;
    ToolPolicy policy;
    std::shared_ptr<ToolCallRetry> retry;
    Sleeper sleeper;

    ChatResponse runTurn(const ChatRequest& request, const TurnEventSink* sink);
    Step runStep(const LLMToolCall& call, const std::vector<ToolDescriptor>& tools);
    static void emit(const TurnEventSink* sink, const std::string& type, nlohmann::json data);
};

#pragma once
#include <chrono>
#include <memory>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/LLMGateway.h"
#include "mcp/ToolPolicy.h"

struct RetryConfig {
    int maxRetries = 2;
    int retryDelayMs = 500;
    bool enableSmartDetection = true;
};

/**
 * @brief 单个 turn 的重试上下文
 * turn 开始时创建,结束即丢弃。
 */
struct RetryContext {
    int attemptCount = 0;
    std::string originalMessage;
    std::vector<std::string> previousReasons;
};

struct RetryDecision {
    bool shouldRetry = false;
    std::string reason;
    nlohmann::json nudgeMessage;  // {"role":"user","content":...} when shouldRetry
};

struct IntentMatch {
    bool needsTool = false;
    std::string intent;
    std::vector<std::string> suggestedTools;
};

// Decides whether a user message asks for something only a tool can do.
class IntentClassifier {
public:
    virtual ~IntentClassifier() = default;
    virtual IntentMatch classify(const std::string& message,
                                 const std::vector<std::string>& toolNames) const = 0;
};

/**
 * Ordered regex patterns (Chinese and English); first match wins and picks
 * the category's tools that exist in the catalog. Without a pattern match,
 * a literal mention of a catalog tool name counts as intent.
 */
class RegexIntentClassifier : public IntentClassifier {
public:
    struct Pattern {
        std::regex pattern;
        std::string description;
        std::vector<std::string> tools;
    };

    RegexIntentClassifier();
    explicit RegexIntentClassifier(std::vector<Pattern> patterns);

    IntentMatch classify(const std::string& message,
                         const std::vector<std::string>& toolNames) const override;

    static std::vector<Pattern> defaultPatterns();

private:
    std::vector<Pattern> patterns;
};

/**
 * @brief 工具调用重试判定
 *
 * 模型本应调用工具却只给出文字时,决定是否注入提示 (nudge) 再生成一次。
 * 只看用户原文与工具目录,从不看工具参数或结果;一旦产生任何
 * 工具调用就不再触发。
 */
class ToolCallRetry {
public:
    explicit ToolCallRetry(std::shared_ptr<IntentClassifier> classifier = nullptr);

    static RetryContext createContext(const std::string& originalMessage);

    RetryDecision analyze(RetryContext& context,
                          const std::vector<LLMToolCall>& toolCalls,
                          const std::vector<ToolDescriptor>& availableTools,
                          const RetryConfig& config) const;

    // Exponential backoff: base, 2*base, 4*base, ...
    static std::chrono::milliseconds retryDelay(int attemptCount, int baseDelayMs = 500);

    static nlohmann::json buildNudgeMessage(int attemptCount, const std::vector<std::string>& suggestedTools);

    static std::string summarize(const RetryContext& context);

    static const std::vector<std::string>& nudgeTemplates();

private:
    std::shared_ptr<IntentClassifier> classifier;
};

#include "agent/ToolCallRetry.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace {
// std::regex matches bytes; CJK characters are three bytes in UTF-8,
// so a gap of up to ten characters is written as .{0,30}.
constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

std::string toLower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::vector<std::string> firstNames(const std::vector<std::string>& names, size_t count) {
    return std::vector<std::string>(names.begin(), names.begin() + std::min(count, names.size()));
}

std::string joinNames(const std::vector<std::string>& names, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += separator;
        out += names[i];
    }
    return out;
}
} // namespace

// ---------------------------------------------------------------------------
// RegexIntentClassifier
// ---------------------------------------------------------------------------

std::vector<RegexIntentClassifier::Pattern> RegexIntentClassifier::defaultPatterns() {
    return {
        {std::regex(R"((?:列出|显示|查看|列一下|看看|list).{0,30}(?:文件|目录|资源|场景|脚本|files?|dir|director(?:y|ies)|resources?|scenes?))", kFlags),
         "list files", {"list_files", "list_project_resources"}},
        {std::regex(R"((?:读取|读一下|打开|查看|看看|read|open|show).{0,30}(?:文件|内容|脚本|场景|file|content|script|scene))", kFlags),
         "read file", {"read_file"}},
        {std::regex(R"((?:写入|写|修改|更新|编辑|创建|新建|write|edit|create))", kFlags),
         "write file", {"write_to_file", "replace_in_file"}},
        {std::regex(R"((?:搜索|查找|找|搜|search|find|grep).{0,30}(?:文件|内容|关键字|files?|content|keywords?))", kFlags),
         "search files", {"search_files"}},
        {std::regex(R"((?:验证|检查|校验|validate|check|lint).{0,30}(?:脚本|语法|格式|script|syntax|format))", kFlags),
         "validate script", {"validate_script"}},
        {std::regex(R"((?:项目|游戏|project|game).{0,30}(?:信息|状态|配置|info|status|config))", kFlags),
         "project info", {}},
        {std::regex(R"((?:运行时|runtime).{0,30}(?:信息|状态|info|status))", kFlags),
         "runtime info", {"get_runtime_info"}},
        {std::regex(R"((?:快照|snapshot|回滚|rollback|恢复|restore))", kFlags),
         "snapshot operations", {"list_snapshots", "restore_snapshot"}}
    };
}

RegexIntentClassifier::RegexIntentClassifier() : patterns(defaultPatterns()) {}

RegexIntentClassifier::RegexIntentClassifier(std::vector<Pattern> patterns)
    : patterns(std::move(patterns)) {}

IntentMatch RegexIntentClassifier::classify(const std::string& message,
                                            const std::vector<std::string>& toolNames) const {
    IntentMatch match;
    std::unordered_set<std::string> available(toolNames.begin(), toolNames.end());
    std::vector<std::string> suggested;

    for (const auto& entry : patterns) {
        if (!std::regex_search(message, entry.pattern)) continue;

        match.intent = entry.description;
        for (const auto& tool : entry.tools) {
            if (available.count(tool)) suggested.push_back(tool);
        }
        break;  // first intent only
    }

    // Fall back to an explicit mention of a tool name ("list_files" or "list files")
    if (match.intent.empty()) {
        std::string lowered = toLower(message);
        for (const auto& name : toolNames) {
            std::string lowerName = toLower(name);
            std::string spaced = lowerName;
            std::replace(spaced.begin(), spaced.end(), '_', ' ');
            if (lowered.find(lowerName) != std::string::npos || lowered.find(spaced) != std::string::npos) {
                suggested.push_back(name);
            }
        }
        if (!suggested.empty()) {
            match.intent = "explicit tool mention";
        }
    }

    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (const auto& name : suggested) {
        if (seen.insert(name).second) unique.push_back(name);
    }

    match.needsTool = !match.intent.empty();
    match.suggestedTools = unique.empty() ? firstNames(toolNames, 3) : unique;
    return match;
}

// ---------------------------------------------------------------------------
// ToolCallRetry
// ---------------------------------------------------------------------------

const std::vector<std::string>& ToolCallRetry::nudgeTemplates() {
    static const std::vector<std::string> templates = {
        "Please use the available tools to complete this task. You can call tools such as {suggestedTools} to get the information you need.",
        "You did not call any tool. Call the relevant tools (e.g. {suggestedTools}) directly instead of only describing what to do.",
        "This task requires tools. Use tool_calls to invoke {suggestedTools}; they will be executed for you."
    };
    return templates;
}

ToolCallRetry::ToolCallRetry(std::shared_ptr<IntentClassifier> classifier)
    : classifier(classifier ? std::move(classifier) : std::make_shared<RegexIntentClassifier>()) {}

RetryContext ToolCallRetry::createContext(const std::string& originalMessage) {
    RetryContext context;
    context.originalMessage = originalMessage;
    return context;
}

RetryDecision ToolCallRetry::analyze(RetryContext& context,
                                     const std::vector<LLMToolCall>& toolCalls,
                                     const std::vector<ToolDescriptor>& availableTools,
                                     const RetryConfig& config) const {
    auto& logger = Logger::getInstance();
    RetryDecision decision;

    if (!toolCalls.empty()) {
        logger.debug("[Retry] Model produced " + std::to_string(toolCalls.size()) + " tool call(s), no retry needed");
        return decision;
    }

    if (context.attemptCount >= config.maxRetries) {
        logger.debug("[Retry] Max retries (" + std::to_string(config.maxRetries) + ") reached, stopping");
        decision.reason = "max retries (" + std::to_string(config.maxRetries) + ") reached";
        return decision;
    }

    if (availableTools.empty()) {
        logger.debug("[Retry] No tools available, cannot retry");
        return decision;
    }

    std::vector<std::string> toolNames;
    toolNames.reserve(availableTools.size());
    for (const auto& tool : availableTools) {
        toolNames.push_back(tool.name);
    }

    std::vector<std::string> suggested;
    if (config.enableSmartDetection) {
        IntentMatch intent = classifier->classify(context.originalMessage, toolNames);
        if (!intent.needsTool) {
            logger.debug("[Retry] User intent does not require tool usage");
            return decision;
        }
        decision.reason = "detected \"" + intent.intent + "\" intent but the model called no tool";
        suggested = intent.suggestedTools;
    } else {
        decision.reason = "model produced no tool call (attempt " +
                          std::to_string(context.attemptCount + 1) + "/" +
                          std::to_string(config.maxRetries) + ")";
        suggested = firstNames(toolNames, 3);
    }

    context.attemptCount++;
    context.previousReasons.push_back(decision.reason);
    decision.shouldRetry = true;
    decision.nudgeMessage = buildNudgeMessage(context.attemptCount, suggested);

    logger.info("[Retry] Retry #" + std::to_string(context.attemptCount) + ": " + decision.reason);
    return decision;
}

std::chrono::milliseconds ToolCallRetry::retryDelay(int attemptCount, int baseDelayMs) {
    int exponent = std::max(0, attemptCount - 1);
    return std::chrono::milliseconds(static_cast<long long>(baseDelayMs) << std::min(exponent, 20));
}

nlohmann::json ToolCallRetry::buildNudgeMessage(int attemptCount, const std::vector<std::string>& suggestedTools) {
    const auto& templates = nudgeTemplates();
    size_t index = static_cast<size_t>(std::max(0, attemptCount - 1));
    index = std::min(index, templates.size() - 1);

    std::string content = templates[index];
    const std::string placeholder = "{suggestedTools}";
    auto pos = content.find(placeholder);
    if (pos != std::string::npos) {
        content.replace(pos, placeholder.size(), joinNames(firstNames(suggestedTools, 3), ", "));
    }

    return {{"role", "user"}, {"content", "[System hint] " + content}};
}

std::string ToolCallRetry::summarize(const RetryContext& context) {
    if (context.attemptCount == 0) {
        return "no retries";
    }
    return "retried " + std::to_string(context.attemptCount) + " time(s): " +
           joinNames(context.previousReasons, " -> ");
}

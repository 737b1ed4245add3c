#include "agent/ConversationOrchestrator.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include "utils/Preview.h"
#include <algorithm>
#include <mutex>
#include <thread>

ConversationOrchestrator::ConversationOrchestrator(std::shared_ptr<LLMGateway> gateway,
                                                   IToolBridge& bridge,
                                                   std::shared_ptr<SessionStore> sessions,
                                                   OrchestratorOptions options,
                                                   ToolPolicy policy,
                                                   std::shared_ptr<ToolCallRetry> retry)
    : gateway(std::move(gateway)),
      bridge(bridge),
      sessions(sessions ? std::move(sessions) : std::make_shared<InMemorySessionStore>()),
      options(std::move(options)),
      policy(std::move(policy)),
      retry(retry ? std::move(retry) : std::make_shared<ToolCallRetry>()),
      sleeper([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

const std::string& ConversationOrchestrator::blockedReason() {
    static const std::string reason =
        "Mutating operation requires user confirmation; it was not executed.";
    return reason;
}

nlohmann::json ConversationOrchestrator::parseArguments(const std::string& raw) {
    if (raw.empty()) return nlohmann::json::object();

    nlohmann::json args = nlohmann::json::parse(raw, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        Logger::getInstance().warn("[Turn] Malformed tool arguments, using {}: " + Preview::truncate(raw, 80));
        return nlohmann::json::object();
    }
    return args;
}

std::string ConversationOrchestrator::composeSummary(const std::string& preamble,
                                                     const std::vector<Step>& steps,
                                                     int retryAttempts) {
    std::vector<std::string> sections;
    if (!preamble.empty()) {
        sections.push_back(preamble);
    }

    if (!steps.empty()) {
        std::string list = "Tool steps:";
        for (size_t i = 0; i < steps.size(); ++i) {
            const auto& step = steps[i];
            list += "\n" + std::to_string(i + 1) + ". " + step.name + " " + Preview::arguments(step.args) + "\n   ";
            if (step.blocked) {
                list += "[blocked] " + step.reason;
            } else if (!step.error.is_null()) {
                list += "[error] " + step.summary;
            } else {
                list += "[ok] " + step.summary;
            }
        }
        sections.push_back(list);
    }

    if (retryAttempts > 0) {
        sections.push_back("(Retried " + std::to_string(retryAttempts) + " time(s) to obtain a tool call.)");
    }

    std::string out;
    for (const auto& section : sections) {
        if (!out.empty()) out += "\n\n";
        out += section;
    }
    return out;
}

void ConversationOrchestrator::emit(const TurnEventSink* sink, const std::string& type, nlohmann::json data) {
    if (sink && *sink) {
        (*sink)(TurnEvent{type, std::move(data)});
    }
}

ChatResponse ConversationOrchestrator::chat(const ChatRequest& request) {
    return runTurn(request, nullptr);
}

void ConversationOrchestrator::chatStream(const ChatRequest& request, const TurnEventSink& sink) {
    try {
        runTurn(request, &sink);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("[Turn] Failed: ") + e.what());
        nlohmann::json data = errorToJson(e);
        data["status"] = statusForTurnError(e);
        emit(&sink, "error", data);
    }
    emit(&sink, "done", nlohmann::json::object());
}

ChatResponse ConversationOrchestrator::runTurn(const ChatRequest& request, const TurnEventSink* sink) {
    auto& logger = Logger::getInstance();

    // 1. Session
    auto session = sessions->getOrCreate(request.sessionId, options.systemPrompt);
    std::lock_guard<std::mutex> turnLock(session->turnMutex);

    std::string userContent = request.message;
    if (!request.scenePath.empty()) {
        userContent = "[scene=" + request.scenePath + "]\n" + request.message;
    }
    session->append({{"role", "user"}, {"content", userContent}});
    session->pinAndTrim(options.systemPrompt, options.maxHistory);

    ChatResponse response;
    response.sessionId = session->id;

    // 2. Catalog
    std::vector<ToolDescriptor> tools;
    if (bridge.isRunning()) {
        tools = bridge.listTools();
    }
    nlohmann::json toolSchemas = nlohmann::json::array();
    for (const auto& tool : tools) {
        toolSchemas.push_back(tool.toFunctionSchema());
    }

    emit(sink, "meta", {{"sessionId", session->id}, {"tools", tools.size()}, {"degraded", !bridge.isRunning()}});
    if (!bridge.isRunning()) {
        logger.warn("[Turn] Tool server not running, continuing without tools");
        emit(sink, "info", {{"message", "Tool server is not running; answering without tools."}});
    }

    logger.action("[Turn] " + session->id + ": " + Preview::truncate(request.message, 80));

    // 3-4. Generate, nudging while the model answers in prose where a tool was expected
    nlohmann::json window = session->messages;
    RetryContext retryContext = ToolCallRetry::createContext(request.message);
    LLMReply reply;
    while (true) {
        reply = gateway->complete(window, toolSchemas);
        response.usage.add(reply.usage);

        if (!reply.toolCalls.empty()) break;

        RetryDecision decision = retry->analyze(retryContext, reply.toolCalls, tools, options.retry);
        if (!decision.shouldRetry) break;

        if (!reply.content.empty()) {
            window.push_back({{"role", "assistant"}, {"content", reply.content}});
        }
        window.push_back(decision.nudgeMessage);
        session->append(decision.nudgeMessage);

        auto delay = ToolCallRetry::retryDelay(retryContext.attemptCount, options.retry.retryDelayMs);
        emit(sink, "retry", {
            {"attempt", retryContext.attemptCount},
            {"reason", decision.reason},
            {"delayMs", delay.count()}
        });
        sleeper(delay);
    }
    response.retryAttempts = retryContext.attemptCount;
    logger.debug("[Turn] " + ToolCallRetry::summarize(retryContext));

    // 5. Branch
    if (reply.toolCalls.empty()) {
        response.content = composeSummary(reply.content, {}, response.retryAttempts);
    } else {
        if (!reply.content.empty()) {
            emit(sink, "assistant", {{"content", reply.content}});
        }

        std::vector<LLMToolCall> calls = reply.toolCalls;
        size_t limit = static_cast<size_t>(std::max(0, options.maxSteps));
        if (calls.size() > limit) {
            logger.warn("[Turn] Model requested " + std::to_string(calls.size()) +
                        " tool calls, keeping the first " + std::to_string(limit));
            emit(sink, "info", {{"message", "Only the first " + std::to_string(limit) + " of " +
                                            std::to_string(calls.size()) + " tool calls will be considered."}});
            calls.resize(limit);
        }

        for (size_t i = 0; i < calls.size(); ++i) {
            Step step = runStep(calls[i], tools);
            emit(sink, "step", {{"index", i}, {"step", step.toJson()}});
            response.steps.push_back(std::move(step));
        }
        response.content = composeSummary(reply.content, response.steps, response.retryAttempts);
    }

    // 6. Summarize
    session->append({{"role", "assistant"}, {"content", response.content}});
    session->pinAndTrim(options.systemPrompt, options.maxHistory);

    emit(sink, "final", {
        {"sessionId", response.sessionId},
        {"content", response.content},
        {"usage", response.usage.toJson()},
        {"retryAttempts", response.retryAttempts}
    });
    logger.success("[Turn] Done: " + std::to_string(response.steps.size()) + " step(s), " +
                   std::to_string(response.retryAttempts) + " retry attempt(s)");
    return response;
}

Step ConversationOrchestrator::runStep(const LLMToolCall& call, const std::vector<ToolDescriptor>& tools) {
    auto& logger = Logger::getInstance();
    Step step;
    step.name = call.name;
    step.args = parseArguments(call.arguments);

    auto it = std::find_if(tools.begin(), tools.end(),
                           [&](const ToolDescriptor& tool) { return tool.name == call.name; });
    bool readOnly = it != tools.end() && it->readOnly;

    if (!readOnly) {
        step.blocked = true;
        step.reason = blockedReason();
        step.summary = "blocked: " + call.name + " needs confirmation";
        logger.info("[Turn] Blocked mutating tool: " + call.name);
        return step;
    }

    step.args = policy.normalizeArguments(call.name, step.args, options.defaultListRoot);
    logger.action("[Turn] Calling " + call.name + " " + Preview::arguments(step.args));

    auto start = std::chrono::steady_clock::now();
    try {
        nlohmann::json payload = bridge.callTool(call.name, step.args);
        step.summary = Preview::result(payload);
        step.result = step.summary;
    } catch (const std::exception& e) {
        step.error = errorToJson(e);
        step.summary = step.error.value("code", std::string("E_INTERNAL")) + ": " + Preview::truncate(e.what());
        logger.warn("[Turn] " + call.name + " failed: " + e.what());
    }
    step.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    return step;
}

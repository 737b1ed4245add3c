#include <iostream>
#include <memory>
#include <string>
#include <filesystem>
#include "agent/ConversationOrchestrator.h"
#include "agent/SessionStore.h"
#include "core/ConfigManager.h"
#include "core/Errors.h"
#include "core/EventLoop.h"
#include "core/LLMGateway.h"
#include "mcp/ProcessBridge.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string YELLOW = "\033[38;5;226m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";
const std::string PURPLE = "\033[38;5;141m";

void printUsage() {
    std::cout << "Usage: ferry <project_root> [config_path]" << std::endl;
    std::cout << GRAY << "  Commands: :status  :tools  :new  exit" << RESET << std::endl;
}

void printStatus(const ProcessBridge& bridge) {
    BridgeStatus status = bridge.getStatus();
    if (status.running) {
        std::cout << GREEN << "✔ Tool server running" << RESET << GRAY << " (pid " << bridge.getPid()
                  << ", " << status.tools.size() << " tools, root " << status.projectRoot << ")" << RESET << std::endl;
    } else {
        std::cout << YELLOW << "⚠ Tool server not running, chat continues without tools" << RESET << std::endl;
    }
}

void printTools(const ProcessBridge& bridge) {
    for (const auto& tool : bridge.listTools()) {
        std::cout << "  " << (tool.readOnly ? GREEN + "[ro] " : YELLOW + "[rw] ") << RESET << BOLD << tool.name << RESET;
        if (!tool.description.empty()) {
            std::cout << GRAY << "  " << tool.description << RESET;
        }
        std::cout << std::endl;
    }
}

void printEvent(const TurnEvent& event) {
    const auto& data = event.data;
    if (event.type == "retry") {
        std::cout << GRAY << "  ↻ retry #" << data.value("attempt", 0) << ": " << data.value("reason", "") << RESET << std::endl;
    } else if (event.type == "assistant") {
        std::cout << PURPLE << "  " << data.value("content", "") << RESET << std::endl;
    } else if (event.type == "info") {
        std::cout << GRAY << "  ℹ " << data.value("message", "") << RESET << std::endl;
    } else if (event.type == "step") {
        const auto& step = data["step"];
        std::string marker = step.value("blocked", false) ? YELLOW + "⏸ " : (step.contains("error") ? RED + "✖ " : GREEN + "✔ ");
        std::cout << "  " << marker << step.value("name", "") << RESET << GRAY << "  " << step.value("summary", "") << RESET << std::endl;
    } else if (event.type == "final") {
        std::cout << "\n" << CYAN << BOLD << "ferry " << RESET << GRAY << "❯ " << RESET << data.value("content", "") << std::endl;
    } else if (event.type == "error") {
        std::cout << RED << "✖ " << data.value("message", "") << " (status " << data.value("status", 500) << ")" << RESET << std::endl;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string projectRoot = fs::absolute(fs::u8path(argv[1])).u8string();
    std::string configPath = argc >= 3 ? argv[2] : "config.json";

    Config cfg;
    try {
        cfg = Config::load(configPath);
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        return 1;
    }

    Logger& logger = Logger::getInstance();
    logger.setLogFile(cfg.log.file);
    logger.setConsoleLevel(Logger::parseLevel(cfg.log.level));

    EventLoop loop;

    BridgeSettings settings;
    settings.command = cfg.bridge.command;
    settings.serverDir = cfg.bridge.serverDir;
    settings.requestTimeout = std::chrono::milliseconds(cfg.bridge.requestTimeoutMs);
    ToolPolicy policy(cfg.agent.readOnlyTools);
    ProcessBridge bridge(loop, settings, policy);

    StartOptions startOptions;
    startOptions.enableExec = cfg.bridge.enableExec;
    startOptions.enableBrowser = cfg.bridge.enableBrowser;
    try {
        bridge.start(projectRoot, startOptions);
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to start tool server: " << e.what() << RESET << std::endl;
    }
    printStatus(bridge);

    LLMGateway::Options gatewayOptions;
    gatewayOptions.apiKey = cfg.llm.apiKey;
    gatewayOptions.baseUrl = cfg.llm.baseUrl;
    gatewayOptions.model = cfg.llm.model;
    gatewayOptions.temperature = cfg.llm.temperature;
    gatewayOptions.maxTokens = cfg.llm.maxTokens;
    auto gateway = std::make_shared<LLMGateway>(gatewayOptions);
    gateway->setSleeper([&loop](std::chrono::milliseconds d) { loop.sleepFor(d); });
    if (!gateway->hasCredential()) {
        std::cout << YELLOW << "⚠ No API key configured (set llm.api_key or FERRY_API_KEY)" << RESET << std::endl;
    }

    OrchestratorOptions orchestratorOptions;
    orchestratorOptions.maxSteps = cfg.agent.maxSteps;
    orchestratorOptions.maxHistory = cfg.agent.maxHistory;
    orchestratorOptions.retry.maxRetries = cfg.agent.maxRetries;
    orchestratorOptions.retry.retryDelayMs = cfg.agent.retryDelayMs;
    orchestratorOptions.retry.enableSmartDetection = cfg.agent.smartDetection;
    orchestratorOptions.systemPrompt = cfg.llm.systemRole;
    orchestratorOptions.defaultListRoot = cfg.agent.defaultListRoot;

    ConversationOrchestrator orchestrator(gateway, bridge, std::make_shared<InMemorySessionStore>(),
                                          orchestratorOptions, policy);
    orchestrator.setSleeper([&loop](std::chrono::milliseconds d) { loop.sleepFor(d); });

    std::string sessionId;
    std::string userInput;
    while (true) {
        std::cout << "\n" << CYAN << BOLD << "❯ " << RESET << std::flush;
        if (!std::getline(std::cin, userInput)) break;
        if (userInput.empty()) continue;

        if (userInput == "exit") break;
        if (userInput == ":status") {
            printStatus(bridge);
            continue;
        }
        if (userInput == ":tools") {
            printTools(bridge);
            continue;
        }
        if (userInput == ":new") {
            sessionId.clear();
            std::cout << GRAY << "  (new session)" << RESET << std::endl;
            continue;
        }

        ChatRequest request;
        request.sessionId = sessionId;
        request.message = userInput;
        orchestrator.chatStream(request, [&](const TurnEvent& event) {
            if (event.type == "meta") {
                sessionId = event.data.value("sessionId", sessionId);
            }
            printEvent(event);
        });
    }

    bridge.stop();
    return 0;
}

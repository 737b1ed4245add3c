#include <gtest/gtest.h>
#include "../src/mcp/ProcessBridge.h"
#include "../src/core/Errors.h"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <signal.h>

#ifndef FAKE_TOOL_SERVER
#error "FAKE_TOOL_SERVER must point at the fake_tool_server executable"
#endif

namespace fs = std::filesystem;

namespace {
bool processGone(pid_t pid) {
    return kill(pid, 0) != 0 && errno == ESRCH;
}

fs::path makeTempDir(const std::string& prefix) {
    std::random_device rd;
    fs::path dir = fs::temp_directory_path() / (prefix + std::to_string(rd()));
    fs::create_directories(dir);
    return dir;
}

class ProcessBridgeTest : public ::testing::Test {
protected:
    EventLoop loop;
    fs::path projectRoot;

    void SetUp() override {
        projectRoot = makeTempDir("ferry_project_");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(projectRoot, ec);
    }

    BridgeSettings fakeSettings(std::vector<std::string> args = {},
                                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        BridgeSettings settings;
        settings.command = FAKE_TOOL_SERVER;
        settings.commandArgs = std::move(args);
        settings.requestTimeout = timeout;
        settings.stopGrace = std::chrono::milliseconds(1000);
        settings.emptyCatalogRetryDelay = std::chrono::milliseconds(50);
        settings.exitPollInterval = std::chrono::milliseconds(50);
        return settings;
    }

    std::unique_ptr<ProcessBridge> startBridge(std::vector<std::string> args = {},
                                               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto bridge = std::make_unique<ProcessBridge>(loop, fakeSettings(std::move(args), timeout));
        bridge->start(projectRoot.string());
        return bridge;
    }
};
} // namespace

TEST_F(ProcessBridgeTest, StartPerformsHandshakeAndFetchesCatalog) {
    auto bridge = startBridge();

    EXPECT_TRUE(bridge->isRunning());
    EXPECT_TRUE(bridge->isInitialized());
    EXPECT_GT(bridge->getPid(), 0);
    EXPECT_EQ(bridge->getServerInfo()["serverInfo"]["name"], "fake-tool-server");
    EXPECT_EQ(bridge->getServerInfo()["protocolVersion"], "2024-11-05");

    auto tools = bridge->listTools();
    ASSERT_EQ(tools.size(), 10u);

    BridgeStatus status = bridge->getStatus();
    EXPECT_TRUE(status.running);
    EXPECT_EQ(status.projectRoot, projectRoot.string());
    EXPECT_EQ(status.toJson()["tools"].size(), 10u);

    for (const auto& tool : tools) {
        if (tool.name == "list_files" || tool.name == "read_file") {
            EXPECT_TRUE(tool.readOnly) << tool.name;
        }
        if (tool.name == "write_to_file" || tool.name == "echo") {
            EXPECT_FALSE(tool.readOnly) << tool.name;
        }
    }
}

TEST_F(ProcessBridgeTest, StopOnStoppedBridgeIsNoOp) {
    ProcessBridge bridge(loop, fakeSettings());
    EXPECT_NO_THROW(bridge.stop());
    EXPECT_NO_THROW(bridge.stop());
    EXPECT_FALSE(bridge.isRunning());

    BridgeStatus status = bridge.getStatus();
    EXPECT_FALSE(status.running);
    EXPECT_TRUE(status.toJson()["projectRoot"].is_null());
    EXPECT_TRUE(status.tools.empty());
}

TEST_F(ProcessBridgeTest, StopResetsState) {
    auto bridge = startBridge();
    pid_t pid = bridge->getPid();

    bridge->stop();
    EXPECT_FALSE(bridge->isRunning());
    EXPECT_FALSE(bridge->isInitialized());
    EXPECT_TRUE(bridge->listTools().empty());
    EXPECT_TRUE(processGone(pid));
    EXPECT_NO_THROW(bridge->stop());
}

TEST_F(ProcessBridgeTest, RestartStopsPreviousProcessFirst) {
    auto bridge = startBridge();
    pid_t first = bridge->getPid();

    bridge->start(projectRoot.string());
    pid_t second = bridge->getPid();

    EXPECT_NE(first, second);
    EXPECT_TRUE(processGone(first));
    EXPECT_TRUE(bridge->isRunning());
    EXPECT_EQ(bridge->listTools().size(), 10u);
}

TEST_F(ProcessBridgeTest, CallToolUnwrapsNestedPayload) {
    auto bridge = startBridge();

    nlohmann::json result = bridge->callTool("list_files", {{"path", "game/scene"}});
    EXPECT_EQ(result["path"], "game/scene");
    ASSERT_TRUE(result["entries"].is_array());
    EXPECT_EQ(result["entries"].size(), 3u);
}

TEST_F(ProcessBridgeTest, ToolApplicationErrorCarriesCodeHintAndDetails) {
    auto bridge = startBridge();

    try {
        bridge->callTool("read_file", {{"path", "missing"}});
        FAIL() << "expected ToolApplicationError";
    } catch (const ToolApplicationError& e) {
        EXPECT_EQ(e.getCode(), "E_NOT_FOUND");
        EXPECT_EQ(e.getHint(), "Check the path");
        EXPECT_EQ(e.getDetails()["path"], "missing");
        EXPECT_EQ(statusForToolErrorCode(e.getCode()), 404);
    }
    // a domain failure leaves the bridge usable
    EXPECT_TRUE(bridge->isRunning());
    EXPECT_EQ(bridge->callTool("read_file", {{"path", "start.txt"}})["content"], "changeBg:bg.png;");
}

TEST_F(ProcessBridgeTest, UnparsablePayloadReturnedAsRawText) {
    auto bridge = startBridge();
    nlohmann::json result = bridge->callTool("raw_text", nlohmann::json::object());
    ASSERT_TRUE(result.is_string());
    EXPECT_EQ(result, "plain text, not json");
}

TEST_F(ProcessBridgeTest, EnvelopeWithoutContentReturnedAsIs) {
    auto bridge = startBridge();
    nlohmann::json result = bridge->callTool("no_content", nlohmann::json::object());
    EXPECT_EQ(result["ok"], true);
}

TEST_F(ProcessBridgeTest, JsonRpcErrorSurfacesAsRpcError) {
    auto bridge = startBridge();
    try {
        bridge->callTool("rpc_error", nlohmann::json::object());
        FAIL() << "expected RpcError";
    } catch (const RpcError& e) {
        EXPECT_EQ(e.getCode(), -32000);
        EXPECT_EQ(e.getData()["hint"], "fake");
    }
    EXPECT_TRUE(bridge->isRunning());
}

TEST_F(ProcessBridgeTest, TimeoutFailsCallButKeepsProcess) {
    auto bridge = startBridge({}, std::chrono::milliseconds(300));
    pid_t pid = bridge->getPid();

    EXPECT_THROW(bridge->callTool("slow", {{"ms", 900}}), ProtocolTimeout);
    EXPECT_TRUE(bridge->isRunning());
    EXPECT_EQ(bridge->getPid(), pid);

    // the late reply arrives while this call waits and is dropped as unmatched
    loop.sleepFor(std::chrono::milliseconds(800));
    nlohmann::json echoed = bridge->callTool("echo", {{"after", "timeout"}});
    EXPECT_EQ(echoed["after"], "timeout");
    EXPECT_EQ(bridge->pendingCount(), 0u);
}

TEST_F(ProcessBridgeTest, PipelinedCallsSettleIndependently) {
    auto bridge = startBridge();

    std::vector<std::string> order;
    int settled = 0;
    auto onError = [&](std::exception_ptr) { ++settled; order.push_back("error"); };

    // both requests are written before either reply arrives
    bridge->callAsync("tools/call", {{"name", "slow"}, {"arguments", {{"ms", 200}}}},
        [&](const nlohmann::json&) { ++settled; order.push_back("slow"); }, onError);
    bridge->callAsync("tools/call", {{"name", "echo"}, {"arguments", {{"v", 1}}}},
        [&](const nlohmann::json&) { ++settled; order.push_back("echo"); }, onError);

    EXPECT_EQ(bridge->pendingCount(), 2u);
    ASSERT_TRUE(loop.runUntil([&] { return settled == 2; }, std::chrono::seconds(5)));
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "slow");
    EXPECT_EQ(order[1], "echo");
    EXPECT_EQ(bridge->pendingCount(), 0u);
}

TEST_F(ProcessBridgeTest, CrashFailsPendingCallAndStopsBridge) {
    auto bridge = startBridge();
    pid_t pid = bridge->getPid();

    EXPECT_THROW(bridge->callTool("crash", nlohmann::json::object()), ProcessTerminated);
    EXPECT_FALSE(bridge->isRunning());
    EXPECT_TRUE(bridge->listTools().empty());
    EXPECT_TRUE(processGone(pid));

    // no auto-restart
    EXPECT_THROW(bridge->callTool("echo", nlohmann::json::object()), ProcessTerminated);
}

TEST_F(ProcessBridgeTest, ReplyWrittenJustBeforeExitIsDelivered) {
    BridgeSettings settings = fakeSettings({"--exit-after-reply"});
    settings.exitPollInterval = std::chrono::milliseconds(1);

    // the exit check races the stdout watcher; repeat to cover both orders
    for (int round = 0; round < 10; ++round) {
        ProcessBridge bridge(loop, settings);
        bridge.start(projectRoot.string());
        pid_t pid = bridge.getPid();

        nlohmann::json result;
        ASSERT_NO_THROW(result = bridge.callTool("echo", {{"round", round}})) << "round " << round;
        EXPECT_EQ(result["round"], round);

        loop.runUntil([&] { return !bridge.isRunning(); }, std::chrono::seconds(2));
        EXPECT_FALSE(bridge.isRunning());
        EXPECT_TRUE(processGone(pid));
    }
}

TEST_F(ProcessBridgeTest, NoisyServerStillCorrelates) {
    auto bridge = startBridge({"--noise"});
    EXPECT_EQ(bridge->listTools().size(), 10u);
    EXPECT_EQ(bridge->callTool("echo", {{"k", "v"}})["k"], "v");
    EXPECT_TRUE(bridge->isRunning());
}

TEST_F(ProcessBridgeTest, FailedHandshakeLeavesBridgeStopped) {
    ProcessBridge bridge(loop, fakeSettings({"--fail-init"}));
    EXPECT_THROW(bridge.start(projectRoot.string()), ProcessTerminated);
    EXPECT_FALSE(bridge.isRunning());
    EXPECT_FALSE(bridge.isInitialized());
}

TEST_F(ProcessBridgeTest, HandshakeTimeoutLeavesBridgeStopped) {
    ProcessBridge bridge(loop, fakeSettings({"--hang-init"}, std::chrono::milliseconds(300)));
    EXPECT_THROW(bridge.start(projectRoot.string()), ProcessTerminated);
    EXPECT_FALSE(bridge.isRunning());
    EXPECT_EQ(bridge.pendingCount(), 0u);
}

TEST_F(ProcessBridgeTest, EmptyCatalogIsRetriedOnce) {
    auto bridge = startBridge({"--empty-tools"});
    EXPECT_EQ(bridge->listTools().size(), 10u);
}

TEST_F(ProcessBridgeTest, PersistentlyEmptyCatalogIsAccepted) {
    auto bridge = startBridge({"--always-empty"});
    EXPECT_TRUE(bridge->isRunning());
    EXPECT_TRUE(bridge->listTools().empty());
}

TEST_F(ProcessBridgeTest, LargeRequestDrainsThroughBackpressure) {
    auto bridge = startBridge();
    const std::string blob(2 * 1024 * 1024, 'a');

    nlohmann::json echoed = bridge->callTool("echo", {{"blob", blob}});
    EXPECT_EQ(echoed["blob"].get<std::string>().size(), blob.size());
    EXPECT_EQ(bridge->queuedBytes(), 0u);
}

TEST_F(ProcessBridgeTest, LargeResponseReassembled) {
    auto bridge = startBridge();
    nlohmann::json result = bridge->callTool("big", {{"size", 500000}});
    EXPECT_EQ(result["data"].get<std::string>().size(), 500000u);
}

TEST_F(ProcessBridgeTest, StopForceKillsProcessIgnoringSigterm) {
    BridgeSettings settings = fakeSettings({"--ignore-term"});
    settings.stopGrace = std::chrono::milliseconds(200);
    ProcessBridge bridge(loop, settings);
    bridge.start(projectRoot.string());
    pid_t pid = bridge.getPid();

    bridge.stop();
    EXPECT_FALSE(bridge.isRunning());
    EXPECT_TRUE(processGone(pid));
}

TEST_F(ProcessBridgeTest, StopFailsOutstandingRequests) {
    auto bridge = startBridge();

    std::exception_ptr failure;
    bridge->callAsync("tools/call", {{"name", "slow"}, {"arguments", {{"ms", 2000}}}},
        [](const nlohmann::json&) {},
        [&](std::exception_ptr e) { failure = e; });
    ASSERT_EQ(bridge->pendingCount(), 1u);

    bridge->stop();
    ASSERT_TRUE(failure);
    EXPECT_THROW(std::rethrow_exception(failure), ProcessTerminated);
    EXPECT_EQ(bridge->pendingCount(), 0u);
}

TEST_F(ProcessBridgeTest, CallOnStoppedBridgeThrows) {
    ProcessBridge bridge(loop, fakeSettings());
    EXPECT_THROW(bridge.callTool("list_files", nlohmann::json::object()), ProcessTerminated);
    EXPECT_THROW(bridge.call("tools/list"), ProcessTerminated);
}

TEST_F(ProcessBridgeTest, MissingExecutableFailsStart) {
    BridgeSettings settings = fakeSettings();
    settings.command = "/nonexistent/ferry-tool-server";
    ProcessBridge bridge(loop, settings);
    EXPECT_THROW(bridge.start(projectRoot.string()), ProcessTerminated);
    EXPECT_FALSE(bridge.isRunning());
}

TEST(ProcessBridgeLaunchTest, ResolutionOrder) {
    EventLoop loop;
    fs::path serverDir = makeTempDir("ferry_server_");

    BridgeSettings settings;
    settings.serverDir = serverDir.string();

    {
        ProcessBridge bridge(loop, settings);
        LaunchCommand command = bridge.resolveLaunchCommand();
        EXPECT_EQ(command.program, "mcp-webgal");
        EXPECT_TRUE(command.args.empty());
    }

    fs::create_directories(serverDir / "src");
    std::ofstream(serverDir / "src" / "bin.ts") << "// source";
    {
        ProcessBridge bridge(loop, settings);
        LaunchCommand command = bridge.resolveLaunchCommand();
        EXPECT_EQ(command.program, "npx");
        ASSERT_EQ(command.args.size(), 3u);
        EXPECT_EQ(command.args[1], "tsx");
        EXPECT_EQ(command.args[2], (serverDir / "src" / "bin.ts").string());
    }

    fs::create_directories(serverDir / "dist");
    std::ofstream(serverDir / "dist" / "bin.js") << "// built";
    {
        ProcessBridge bridge(loop, settings);
        LaunchCommand command = bridge.resolveLaunchCommand();
        EXPECT_EQ(command.program, "node");
        ASSERT_EQ(command.args.size(), 1u);
        EXPECT_EQ(command.args[0], (serverDir / "dist" / "bin.js").string());
    }

    settings.command = "/opt/tools/server";
    settings.commandArgs = {"--stdio"};
    {
        ProcessBridge bridge(loop, settings);
        LaunchCommand command = bridge.resolveLaunchCommand();
        EXPECT_EQ(command.program, "/opt/tools/server");
        EXPECT_EQ(command.toString(), "/opt/tools/server --stdio");
    }

    std::error_code ec;
    fs::remove_all(serverDir, ec);
}

TEST(ProcessBridgeUnwrapTest, ErrorPayloadWithoutCodeDefaultsToInternal) {
    nlohmann::json envelope = {{"content", {{{"type", "text"}, {"text", R"({"error":{"message":"bad"}})"}}}}};
    try {
        ProcessBridge::unwrapToolResult("x", envelope);
        FAIL() << "expected ToolApplicationError";
    } catch (const ToolApplicationError& e) {
        EXPECT_EQ(e.getCode(), "E_INTERNAL");
        EXPECT_STREQ(e.what(), "bad");
    }
}

TEST(ProcessBridgeUnwrapTest, NonEnvelopeResultsPassThrough) {
    EXPECT_EQ(ProcessBridge::unwrapToolResult("x", 5), 5);
    nlohmann::json emptyContent = {{"content", nlohmann::json::array()}};
    EXPECT_EQ(ProcessBridge::unwrapToolResult("x", emptyContent), emptyContent);
    nlohmann::json arrayPayload = {{"content", {{{"type", "text"}, {"text", "[1,2]"}}}}};
    EXPECT_EQ(ProcessBridge::unwrapToolResult("x", arrayPayload), nlohmann::json::parse("[1,2]"));
}

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "policy/path_resolver.hpp"
#include "runtime/idle_watchdog.hpp"
#include "runtime/request_dispatcher.hpp"
#include "runtime/task_supervisor.hpp"
#include "session/credential_vault.hpp"
#include "temp_workspace.hpp"
#include "tools/tool_host.hpp"

namespace {

using nlohmann::json;
using toolsrv::core::config::ServerConfig;
using toolsrv::policy::PathResolver;
using toolsrv::protocol::CredentialAckResponse;
using toolsrv::protocol::ErrorCode;
using toolsrv::protocol::ErrorResponse;
using toolsrv::protocol::Response;
using toolsrv::protocol::ResultResponse;
using toolsrv::runtime::DispatchOutcome;
using toolsrv::runtime::IdleWatchdog;
using toolsrv::runtime::RequestDispatcher;
using toolsrv::runtime::TaskSupervisor;
using toolsrv::session::CredentialVault;
using toolsrv::testing::TempWorkspace;
using toolsrv::testing::write_file;

ServerConfig config_for(const TempWorkspace& sandbox) {
    ServerConfig config;
    config.workspace_root = sandbox.root();
    config.skills_root = sandbox.root() / "skills";
    return config;
}

class RequestDispatcherTest : public ::testing::Test {
protected:
    RequestDispatcherTest()
        : sandbox_("dispatcher"),
          config_(config_for(sandbox_)),
          resolver_(config_.workspace_root, config_.skills_root),
          host_(config_, resolver_, vault_),
          watchdog_(60000),
          dispatcher_(vault_, host_, supervisor_, watchdog_,
                      [this](const Response& response) { sent_.push_back(response); }) {}

    DispatchOutcome send(const json& payload) {
        return dispatcher_.handle_payload(payload.dump());
    }

    // Waits for one task and routes it back through the dispatcher.
    void complete_one() {
        ASSERT_TRUE(supervisor_.wait_for_completion(std::chrono::seconds(10)));
        for (auto& completion : supervisor_.drain()) {
            dispatcher_.complete(std::move(completion));
        }
    }

    TempWorkspace sandbox_;
    ServerConfig config_;
    CredentialVault vault_;
    PathResolver resolver_;
    toolsrv::tools::ToolHost host_;
    IdleWatchdog watchdog_;
    TaskSupervisor supervisor_;
    std::vector<Response> sent_;
    RequestDispatcher dispatcher_;
};

TEST_F(RequestDispatcherTest, InvalidJsonYieldsUntaggedError) {
    EXPECT_EQ(dispatcher_.handle_payload("not json"), DispatchOutcome::Continue);
    ASSERT_EQ(sent_.size(), 1u);
    const auto& error = std::get<ErrorResponse>(sent_[0]);
    EXPECT_FALSE(error.id.has_value());
    EXPECT_EQ(error.message, "Invalid JSON: not json");
}

TEST_F(RequestDispatcherTest, InvalidJsonPreviewIsBounded) {
    dispatcher_.handle_payload(std::string(500, '{'));
    const auto& error = std::get<ErrorResponse>(sent_.at(0));
    EXPECT_EQ(error.message, "Invalid JSON: " + std::string(100, '{'));
}

TEST_F(RequestDispatcherTest, UnknownRequestEchoesId) {
    send(json{{"type", "ping"}, {"id", "r1"}});
    ASSERT_EQ(sent_.size(), 1u);
    const auto& error = std::get<ErrorResponse>(sent_[0]);
    EXPECT_EQ(error.id.value_or(""), "r1");
    EXPECT_EQ(error.message, "Unknown request type: ping");
}

TEST_F(RequestDispatcherTest, CredentialIsStoredAndAcknowledgedByName) {
    send(json{{"type", "credential"}, {"name", "api_key"}, {"value", "secret123"}});
    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_EQ(std::get<CredentialAckResponse>(sent_[0]).name, "api_key");
    EXPECT_EQ(vault_.lookup("api_key").value_or(""), "secret123");
}

TEST_F(RequestDispatcherTest, InvalidCredentialNameIsRefused) {
    send(json{{"type", "credential"}, {"name", "A=B"}, {"value", "secret123"}});
    ASSERT_EQ(sent_.size(), 1u);
    const auto& error = std::get<ErrorResponse>(sent_[0]);
    EXPECT_EQ(error.message.find("secret123"), std::string::npos);
    EXPECT_EQ(vault_.size(), 0u);
}

TEST_F(RequestDispatcherTest, UnknownToolIsAnInvalidArgsResult) {
    send(json{{"type", "execute"}, {"id", "t1"}, {"tool", "fetch"}, {"args", json::object()}});
    ASSERT_EQ(sent_.size(), 1u);
    const auto& result = std::get<ResultResponse>(sent_[0]);
    EXPECT_EQ(result.id, "t1");
    EXPECT_FALSE(result.result.ok);
    EXPECT_EQ(result.result.error_code, ErrorCode::InvalidArgs);
    EXPECT_EQ(result.result.output, "Unknown tool: fetch");
}

TEST_F(RequestDispatcherTest, ExecuteRunsOnSupervisorAndKeepsId) {
    write_file(sandbox_.root() / "a.txt", "hello\n");
    send(json{{"type", "execute"}, {"id", "e1"}, {"tool", "read"}, {"args", {{"path", "a.txt"}}}});
    EXPECT_TRUE(sent_.empty());

    complete_one();
    ASSERT_EQ(sent_.size(), 1u);
    const auto& result = std::get<ResultResponse>(sent_[0]);
    EXPECT_EQ(result.id, "e1");
    EXPECT_TRUE(result.result.ok);
    EXPECT_EQ(result.result.output, "1| hello");
}

TEST_F(RequestDispatcherTest, FailedTaskBecomesTaggedError) {
    supervisor_.launch("boom", []() -> toolsrv::protocol::ToolResult {
        throw std::runtime_error("executor exploded");
    });
    complete_one();
    ASSERT_EQ(sent_.size(), 1u);
    const auto& error = std::get<ErrorResponse>(sent_[0]);
    EXPECT_EQ(error.id.value_or(""), "boom");
    EXPECT_EQ(error.message, "executor exploded");
}

TEST_F(RequestDispatcherTest, ShutdownStopsDispatch) {
    EXPECT_EQ(send(json{{"type", "shutdown"}}), DispatchOutcome::Shutdown);
    EXPECT_TRUE(sent_.empty());
}

TEST_F(RequestDispatcherTest, OversizedFrameYieldsUntaggedError) {
    dispatcher_.handle_oversized(20000000);
    const auto& error = std::get<ErrorResponse>(sent_.at(0));
    EXPECT_FALSE(error.id.has_value());
    EXPECT_EQ(error.message, "Frame too large: 20000000");
}

TEST(IdleWatchdogTest, ResetPushesDeadlineForward) {
    IdleWatchdog watchdog(200);
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    EXPECT_LE(watchdog.remaining_ms(), 80);
    watchdog.reset();
    EXPECT_GT(watchdog.remaining_ms(), 150);
    EXPECT_FALSE(watchdog.expired());
}

TEST(IdleWatchdogTest, ExpiresAfterTimeout) {
    IdleWatchdog watchdog(20);
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    EXPECT_TRUE(watchdog.expired());
    EXPECT_EQ(watchdog.remaining_ms(), 0);
}

}  // namespace

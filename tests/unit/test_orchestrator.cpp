#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/logging/logger.hpp"
#include "events/event_bus.hpp"
#include "fake_tool.hpp"
#include "runtime/orchestrator.hpp"

namespace {

using conduit::core::context::ExecutionContext;
using conduit::core::errors::EngineError;
using conduit::core::errors::ErrorCategory;
using conduit::core::errors::get_error;
using conduit::core::errors::get_value;
using conduit::core::errors::is_error;
using conduit::core::errors::Result;
using conduit::protocol::EventType;
using conduit::protocol::ToolInput;
using conduit::protocol::ToolOutput;
using conduit::protocol::Workflow;
using conduit::protocol::WorkflowStep;
using conduit::runtime::Orchestrator;
using conduit::testing::FakeTool;
using conduit::testing::reported_failure;
using conduit::testing::succeeded;

std::shared_ptr<FakeTool> echo_tool(const std::string& name) {
    return std::make_shared<FakeTool>(
        name, [](const ExecutionContext&, const ToolInput& input) -> Result<ToolOutput> {
            return succeeded(input.data);
        });
}

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        conduit::core::logging::Logger::get().set_min_level(
            conduit::core::logging::LogLevel::ERROR);
    }

    std::shared_ptr<conduit::tools::ToolRegistry> registry =
        std::make_shared<conduit::tools::ToolRegistry>();
};

TEST_F(OrchestratorTest, ExecutesRegisteredTool) {
    Orchestrator orchestrator(registry);
    ASSERT_FALSE(is_error(orchestrator.register_tool(echo_tool("echo"))));

    ToolInput input;
    input.data = {{"message", "hi"}};
    auto result = orchestrator.execute(ExecutionContext::background(), "echo", input);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).success);
    EXPECT_EQ(get_value(result).data["message"], "hi");
    EXPECT_EQ(orchestrator.request_count(), 1u);
    EXPECT_EQ(orchestrator.error_count(), 0u);
}

TEST_F(OrchestratorTest, UnknownToolIsNotFound) {
    Orchestrator orchestrator(registry);
    auto result = orchestrator.execute(ExecutionContext::background(), "ghost", ToolInput{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::NotFound);
    EXPECT_EQ(get_error(result).code, "tool_not_found");
}

TEST_F(OrchestratorTest, MissingRequiredInputIsRejectedBeforeExecution) {
    Orchestrator orchestrator(registry);
    auto tool = std::make_shared<FakeTool>(
        "analyze",
        [](const ExecutionContext&, const ToolInput&) -> Result<ToolOutput> { return succeeded(); },
        std::vector<std::string>{"repo_path"});
    ASSERT_FALSE(is_error(orchestrator.register_tool(tool)));

    auto result = orchestrator.execute(ExecutionContext::background(), "analyze", ToolInput{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "missing_required_field");
    EXPECT_EQ(tool->calls(), 0);
}

TEST_F(OrchestratorTest, ThrowingToolBecomesInternalError) {
    Orchestrator orchestrator(registry);
    ASSERT_FALSE(is_error(orchestrator.register_tool(std::make_shared<FakeTool>(
        "explode", [](const ExecutionContext&, const ToolInput&) -> Result<ToolOutput> {
            throw std::runtime_error("boom");
        }))));

    auto result = orchestrator.execute(ExecutionContext::background(), "explode", ToolInput{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(result).code, "tool_exception");
    EXPECT_EQ(orchestrator.error_count(), 1u);
}

TEST_F(OrchestratorTest, DefaultTimeoutIsImposed) {
    conduit::core::config::OrchestratorSettings settings;
    settings.default_timeout = std::chrono::milliseconds(30);
    Orchestrator orchestrator(registry, settings);
    ASSERT_FALSE(is_error(orchestrator.register_tool(std::make_shared<FakeTool>(
        "slow", [](const ExecutionContext& ctx, const ToolInput&) -> Result<ToolOutput> {
            if (!ctx.sleep_for(std::chrono::seconds(5))) {
                return EngineError{ErrorCategory::Execution, "interrupted", "interrupted"};
            }
            return succeeded();
        }))));

    const auto started = std::chrono::steady_clock::now();
    auto result = orchestrator.execute(ExecutionContext::background(), "slow", ToolInput{});
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Timeout);
    EXPECT_EQ(get_error(result).code, "tool_execution_timeout");
}

TEST_F(OrchestratorTest, ClosedOrchestratorRejectsCalls) {
    Orchestrator orchestrator(registry);
    ASSERT_FALSE(is_error(orchestrator.register_tool(echo_tool("echo"))));
    orchestrator.close();
    orchestrator.close();

    auto result = orchestrator.execute(ExecutionContext::background(), "echo", ToolInput{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Overload);
    EXPECT_EQ(get_error(result).code, "orchestrator_closed");
    EXPECT_EQ(orchestrator.health()["status"], "closed");
}

TEST_F(OrchestratorTest, WorkflowStopsAtFirstFailingStep) {
    Orchestrator orchestrator(registry);
    auto a = echo_tool("a");
    auto b = std::make_shared<FakeTool>(
        "b", [](const ExecutionContext&, const ToolInput&) -> Result<ToolOutput> {
            return reported_failure("b broke");
        });
    auto c = echo_tool("c");
    ASSERT_FALSE(is_error(orchestrator.register_tool(a)));
    ASSERT_FALSE(is_error(orchestrator.register_tool(b)));
    ASSERT_FALSE(is_error(orchestrator.register_tool(c)));

    Workflow workflow;
    workflow.name = "abc";
    workflow.steps = {WorkflowStep{"first", "a", {}}, WorkflowStep{"second", "b", {}},
                      WorkflowStep{"third", "c", {}}};

    auto result = orchestrator.execute_workflow(ExecutionContext::background(), workflow);
    ASSERT_FALSE(is_error(result));
    const auto& summary = get_value(result);
    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.total_steps, 3u);
    EXPECT_EQ(summary.successful_steps, 1u);
    EXPECT_EQ(summary.failed_steps, 1u);
    ASSERT_EQ(summary.step_results.size(), 2u);
    EXPECT_EQ(summary.step_results[0].step_id, "step-1");
    EXPECT_TRUE(summary.step_results[0].success);
    EXPECT_EQ(summary.step_results[1].step_id, "step-2");
    EXPECT_FALSE(summary.step_results[1].success);
    EXPECT_EQ(summary.step_results[1].error, "b broke");
    EXPECT_EQ(c->calls(), 0);
}

TEST_F(OrchestratorTest, WorkflowMergesVariablesUnderStepInput) {
    Orchestrator orchestrator(registry);
    ASSERT_FALSE(is_error(orchestrator.register_tool(echo_tool("echo"))));

    Workflow workflow;
    workflow.id = "wf-fixed";
    workflow.variables = {{"env", "staging"}, {"region", "eu"}, {"session_id", "s-1"}};
    workflow.steps = {WorkflowStep{"only", "echo", {{"region", "us"}}}};

    auto result = orchestrator.execute_workflow(ExecutionContext::background(), workflow);
    ASSERT_FALSE(is_error(result));
    const auto& summary = get_value(result);
    EXPECT_TRUE(summary.success);
    EXPECT_EQ(summary.workflow_id, "wf-fixed");
    const auto& data = summary.step_results.at(0).output.data;
    EXPECT_EQ(data["env"], "staging");
    EXPECT_EQ(data["region"], "us");
}

TEST_F(OrchestratorTest, EmptyWorkflowIsRejected) {
    Orchestrator orchestrator(registry);
    auto result = orchestrator.execute_workflow(ExecutionContext::background(), Workflow{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "empty_workflow");
}

TEST_F(OrchestratorTest, PublishesLifecycleEvents) {
    conduit::events::EventBus bus;
    Orchestrator orchestrator(registry, {}, &bus);
    ASSERT_FALSE(is_error(orchestrator.register_tool(echo_tool("echo"))));

    Workflow workflow;
    workflow.steps = {WorkflowStep{"only", "echo", {}}};
    ASSERT_FALSE(is_error(orchestrator.execute_workflow(ExecutionContext::background(), workflow)));

    std::vector<EventType> types;
    for (const auto& event : bus.get_event_history()) {
        types.push_back(event.type);
    }
    EXPECT_EQ(types, (std::vector<EventType>{EventType::ToolRegistered, EventType::WorkflowStarted,
                                             EventType::WorkflowCompleted}));
    bus.close();
}

TEST_F(OrchestratorTest, HealthReportsCounters) {
    Orchestrator orchestrator(registry);
    ASSERT_FALSE(is_error(orchestrator.register_tool(echo_tool("echo"))));
    ASSERT_FALSE(is_error(orchestrator.execute(ExecutionContext::background(), "echo", ToolInput{})));

    const auto health = orchestrator.health();
    EXPECT_EQ(health["status"], "healthy");
    EXPECT_EQ(health["tools"], 1);
    EXPECT_EQ(health["requests"], 1);
    EXPECT_EQ(health["errors"], 0);
}

}  // namespace

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "agent/agent_loop.hpp"
#include "core/errors.hpp"
#include "support/scripted_engine.hpp"

using namespace conductor;
using namespace conductor::test_support;

namespace {

std::vector<ProgressEvent> drain(EventStream &events) {
  std::vector<ProgressEvent> out;
  while (auto event = events.next()) {
    out.push_back(std::move(*event));
  }
  return out;
}

std::vector<EventType> types_of(const std::vector<ProgressEvent> &events) {
  std::vector<EventType> types;
  for (const auto &e : events) types.push_back(e.type);
  return types;
}

Conversation prior_history() {
  return {Message::user("Hi"), Message::assistant({ContentBlock::text_block("Hello! How can I help?")})};
}

// storage provider: create_item / list_items backed by a vector
std::shared_ptr<FunctionProvider> storage_provider() {
  auto items = std::make_shared<std::vector<std::string>>();
  auto provider = std::make_shared<FunctionProvider>("storage");
  provider->add("create_item", [items](const json &args) {
    items->push_back(args.value("title", ""));
    return "Created item \"" + items->back() + "\" with ID " + std::to_string(1000 + items->size());
  });
  provider->add("list_items", [items](const json &) {
    std::string out;
    for (std::size_t i = 0; i < items->size(); ++i) {
      if (!out.empty()) out += "\n";
      out += std::to_string(1001 + i) + ": " + (*items)[i];
    }
    return out.empty() ? std::string("No items.") : out;
  });
  return provider;
}

}  // namespace

// ============================================================
// AgentLoopTest: 基本轮次
// ============================================================

TEST(AgentLoopTest, PlainAnswer) {
  ToolRegistry registry;
  register_function_provider(registry, 1, storage_provider());

  auto engine = std::make_shared<ScriptedEngine>(std::vector<llm::LlmResponse>{text_response("Hello there")});
  AgentOptions options;
  options.model = "test-model";
  options.system_prompt = "Be brief.";
  AgentLoop loop(engine, registry, options);

  EventStream events;
  auto turn = loop.run_turn(prior_history(), "Say hello", events);
  auto emitted = drain(events);

  ASSERT_EQ(types_of(emitted), (std::vector<EventType>{EventType::FinalResponse, EventType::TurnComplete}));
  EXPECT_EQ(emitted[0].text, "Hello there");
  EXPECT_EQ(emitted[1].conversation.size(), 4u);

  EXPECT_TRUE(turn.completed);
  EXPECT_TRUE(turn.error.empty());
  EXPECT_EQ(turn.rounds, 1);
  EXPECT_EQ(turn.usage.total(), 15);
  ASSERT_EQ(turn.conversation.size(), 4u);
  EXPECT_EQ(turn.conversation[2].text(), "Say hello");
  EXPECT_EQ(turn.conversation[3].role, Role::Assistant);

  auto requests = engine->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].model, "test-model");
  EXPECT_EQ(requests[0].system_prompt, "Be brief.");
  EXPECT_EQ(requests[0].messages.size(), 3u);
  ASSERT_EQ(requests[0].tools.size(), 2u);
  EXPECT_EQ(requests[0].tools[0].name, "create_item");
}

TEST(AgentLoopTest, CreateItemRoundTrip) {
  ToolRegistry registry;
  auto storage = storage_provider();
  register_function_provider(registry, 1, storage);

  auto engine = std::make_shared<ScriptedEngine>(std::vector<llm::LlmResponse>{
      tool_response({ContentBlock::tool_use("toolu_1", "create_item", json{{"title", "buy milk"}})}, "Adding it."),
      text_response("I've added \"buy milk\" to your list.")});
  AgentLoop loop(engine, registry);

  auto history = prior_history();
  EventStream events;
  auto turn = loop.run_turn(history, "Add buy milk to my list", events);
  auto emitted = drain(events);

  ASSERT_EQ(types_of(emitted), (std::vector<EventType>{EventType::ToolCall, EventType::ToolResult,
                                                       EventType::FinalResponse, EventType::TurnComplete}));
  EXPECT_EQ(emitted[0].id, "toolu_1");
  EXPECT_EQ(emitted[0].name, "create_item");
  EXPECT_EQ(emitted[0].input["title"], "buy milk");
  EXPECT_EQ(emitted[1].id, "toolu_1");
  EXPECT_EQ(emitted[1].result, "Created item \"buy milk\" with ID 1001");
  EXPECT_FALSE(emitted[1].is_error);
  EXPECT_EQ(emitted[2].text, "I've added \"buy milk\" to your list.");

  // history + 用户消息 + (assistant tool_use, tool_result, assistant 最终回答)
  ASSERT_EQ(turn.conversation.size(), history.size() + 1 + 3);
  EXPECT_EQ(conversation_to_json(emitted[3].conversation), conversation_to_json(turn.conversation));

  const auto &results = turn.conversation[4];
  EXPECT_EQ(results.role, Role::User);
  ASSERT_EQ(results.blocks.size(), 1u);
  EXPECT_EQ(results.blocks[0].type, BlockType::ToolResult);
  EXPECT_EQ(results.blocks[0].tool_use_id, "toolu_1");

  EXPECT_EQ(storage->calls(), (std::vector<std::string>{"create_item"}));
  EXPECT_EQ(turn.rounds, 2);
}

TEST(AgentLoopTest, ToolCallsKeepEngineOrder) {
  ToolRegistry registry;
  auto provider = std::make_shared<FunctionProvider>("mixed");
  provider->add("slow", [](const json &) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return std::string("slow done");
  });
  provider->add("fast", [](const json &) { return std::string("fast done"); });
  register_function_provider(registry, 1, provider);

  auto engine = std::make_shared<ScriptedEngine>(std::vector<llm::LlmResponse>{
      tool_response({ContentBlock::tool_use("a", "slow", json::object()),
                     ContentBlock::tool_use("b", "fast", json::object())}),
      text_response("both done")});
  AgentLoop loop(engine, registry);

  EventStream events;
  auto turn = loop.run_turn({}, "run both", events);
  auto emitted = drain(events);

  ASSERT_EQ(emitted.size(), 6u);
  EXPECT_EQ(emitted[0].type, EventType::ToolCall);
  EXPECT_EQ(emitted[0].id, "a");
  EXPECT_EQ(emitted[1].type, EventType::ToolResult);
  EXPECT_EQ(emitted[1].id, "a");
  EXPECT_EQ(emitted[2].id, "b");
  EXPECT_EQ(emitted[3].id, "b");

  auto requests = engine->requests();
  ASSERT_EQ(requests.size(), 2u);
  const auto &results = requests[1].messages.back();
  ASSERT_EQ(results.blocks.size(), 2u);
  EXPECT_EQ(results.blocks[0].tool_use_id, "a");
  EXPECT_EQ(results.blocks[0].content, "slow done");
  EXPECT_EQ(results.blocks[1].tool_use_id, "b");
  EXPECT_EQ(results.blocks[1].content, "fast done");
  EXPECT_TRUE(turn.completed);
}

// ============================================================
// AgentLoopTest: 工具失败不会终止轮次
// ============================================================

TEST(AgentLoopTest, UnknownToolIsReportedToEngine) {
  ToolRegistry registry;
  register_function_provider(registry, 1, storage_provider());

  auto engine = std::make_shared<ScriptedEngine>(std::vector<llm::LlmResponse>{
      tool_response({ContentBlock::tool_use("toolu_9", "delete_everything", json::object())}),
      text_response("I can't do that.")});
  AgentLoop loop(engine, registry);

  EventStream events;
  auto turn = loop.run_turn({}, "Delete it all", events);
  auto emitted = drain(events);

  ASSERT_EQ(emitted.size(), 4u);
  EXPECT_EQ(emitted[1].type, EventType::ToolResult);
  EXPECT_TRUE(emitted[1].is_error);
  EXPECT_EQ(emitted[1].result.rfind("Error: ", 0), 0u);
  EXPECT_NE(emitted[1].result.find("delete_everything"), std::string::npos);

  auto requests = engine->requests();
  ASSERT_EQ(requests.size(), 2u);
  const auto &fed_back = requests[1].messages.back().blocks.at(0);
  EXPECT_EQ(fed_back.tool_use_id, "toolu_9");
  EXPECT_TRUE(fed_back.is_error);
  EXPECT_TRUE(turn.completed);
}

TEST(AgentLoopTest, ProviderFailuresFoldedIntoResults) {
  ToolRegistry registry;
  auto provider = std::make_shared<FunctionProvider>("flaky");
  provider->add("fail_tool", [](const json &) -> std::string { throw ToolInvocationError("fail_tool", "Item not found"); });
  provider->add("down_tool", [](const json &) -> std::string { throw TransportError("Provider 'flaky' exited"); });
  register_function_provider(registry, 1, provider);

  auto engine = std::make_shared<ScriptedEngine>(std::vector<llm::LlmResponse>{
      tool_response({ContentBlock::tool_use("1", "fail_tool", json::object()),
                     ContentBlock::tool_use("2", "down_tool", json::object())}),
      text_response("Both failed.")});
  AgentLoop loop(engine, registry);

  EventStream events;
  auto turn = loop.run_turn({}, "try", events);
  auto emitted = drain(events);

  ASSERT_EQ(types_of(emitted), (std::vector<EventType>{EventType::ToolCall, EventType::ToolResult, EventType::ToolCall,
                                                       EventType::ToolResult, EventType::FinalResponse,
                                                       EventType::TurnComplete}));
  EXPECT_EQ(emitted[1].result, "Error: Item not found");
  EXPECT_TRUE(emitted[1].is_error);
  EXPECT_EQ(emitted[3].result, "Error: Provider 'flaky' exited");
  EXPECT_TRUE(emitted[3].is_error);
  EXPECT_TRUE(turn.completed);
}

// ============================================================
// AgentLoopTest: 轮次失败
// ============================================================

TEST(AgentLoopTest, ToolUseStopWithoutCallsIsAnError) {
  ToolRegistry registry;
  llm::LlmResponse empty;
  empty.stop_reason = StopReason::ToolUse;
  auto engine = std::make_shared<ScriptedEngine>(std::vector<llm::LlmResponse>{empty});
  AgentLoop loop(engine, registry);

  EventStream events;
  auto turn = loop.run_turn({}, "hello", events);
  auto emitted = drain(events);

  ASSERT_EQ(types_of(emitted), (std::vector<EventType>{EventType::Error}));
  EXPECT_FALSE(turn.completed);
  EXPECT_FALSE(turn.error.empty());
  EXPECT_EQ(engine->requests().size(), 1u);
}

TEST(AgentLoopTest, RoundBound) {
  ToolRegistry registry;
  auto provider = std::make_shared<FunctionProvider>("loopy");
  provider->add("again", [](const json &) { return std::string("ok"); });
  register_function_provider(registry, 1, provider);

  std::vector<llm::LlmResponse> script;
  for (int i = 0; i < 5; ++i) {
    script.push_back(tool_response({ContentBlock::tool_use("t" + std::to_string(i), "again", json::object())}));
  }
  auto engine = std::make_shared<ScriptedEngine>(script);

  AgentOptions options;
  options.max_rounds = 2;
  AgentLoop loop(engine, registry, options);

  EventStream events;
  auto turn = loop.run_turn({}, "loop forever", events);
  auto emitted = drain(events);

  ASSERT_EQ(types_of(emitted), (std::vector<EventType>{EventType::ToolCall, EventType::ToolResult, EventType::ToolCall,
                                                       EventType::ToolResult, EventType::Error}));
  EXPECT_NE(emitted.back().message.find("maximum of 2"), std::string::npos);
  EXPECT_EQ(turn.rounds, 2);
  EXPECT_FALSE(turn.completed);
  EXPECT_EQ(engine->requests().size(), 2u);
}

TEST(AgentLoopTest, EngineFailureEndsTurn) {
  ToolRegistry registry;
  auto engine = std::make_shared<ScriptedEngine>(std::vector<llm::LlmResponse>{});
  AgentLoop loop(engine, registry);

  EventStream events;
  auto turn = loop.run_turn(prior_history(), "anyone there?", events);
  auto emitted = drain(events);

  ASSERT_EQ(emitted.size(), 1u);
  EXPECT_EQ(emitted[0].type, EventType::Error);
  EXPECT_NE(emitted[0].message.find("no response"), std::string::npos);
  EXPECT_FALSE(turn.completed);
  EXPECT_EQ(turn.conversation.size(), 3u);
}

// ============================================================
// AgentLoopTest: 无状态
// ============================================================

TEST(AgentLoopTest, SameInputSameConversation) {
  auto script = std::vector<llm::LlmResponse>{
      tool_response({ContentBlock::tool_use("toolu_1", "create_item", json{{"title", "bread"}})}),
      text_response("Added bread.")};

  auto run = [&script]() {
    ToolRegistry registry;
    register_function_provider(registry, 1, storage_provider());
    AgentLoop loop(std::make_shared<ScriptedEngine>(script), registry);
    EventStream events;
    auto conversation = conversation_to_json(loop.run_turn(prior_history(), "Add bread", events).conversation);
    json emitted = json::array();
    for (const auto &event : drain(events)) emitted.push_back(event.to_json());
    return std::make_pair(conversation, emitted);
  };

  auto first = run();
  auto second = run();
  EXPECT_EQ(first.first, second.first);
  // 事件序列也逐项相同
  EXPECT_EQ(first.second, second.second);
  EXPECT_EQ(first.second.size(), 4u);
}

TEST(AgentLoopTest, ConcurrentTurnsShareOneLoop) {
  ToolRegistry registry;
  AgentLoop loop(std::make_shared<EchoEngine>(), registry);

  std::vector<std::thread> threads;
  std::vector<std::string> answers(4);
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&loop, &answers, i]() {
      EventStream events;
      auto turn = loop.run_turn({}, "message " + std::to_string(i), events);
      answers[i] = turn.conversation.back().text();
    });
  }
  for (auto &t : threads) t.join();

  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(answers[i], "echo: message " + std::to_string(i));
  }
}

TEST(AgentLoopTest, OptionsFromConfig) {
  Config config;
  config.engine.model = "claude-opus";
  config.engine.max_tokens = 2048;
  config.engine.temperature = 0.2;
  config.engine.system_prompt = "You manage todos.";
  config.agent.max_rounds = 7;

  auto options = AgentOptions::from_config(config);
  EXPECT_EQ(options.model, "claude-opus");
  EXPECT_EQ(options.max_tokens, 2048);
  ASSERT_TRUE(options.temperature.has_value());
  EXPECT_DOUBLE_EQ(*options.temperature, 0.2);
  EXPECT_EQ(options.system_prompt, "You manage todos.");
  EXPECT_EQ(options.max_rounds, 7);

  EXPECT_EQ(to_string(LoopState::AwaitingEngine), "AwaitingEngine");
  EXPECT_EQ(to_string(LoopState::DispatchingTools), "DispatchingTools");
  EXPECT_EQ(to_string(LoopState::Done), "Done");
}

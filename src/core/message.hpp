#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace conductor {

using json = nlohmann::json;

enum class Role { User, Assistant };

std::string to_string(Role role);
Role role_from_string(const std::string &s);

enum class BlockType { Text, ToolUse, ToolResult, Other };

// One typed block of message content, in the engine's wire vocabulary
struct ContentBlock {
  BlockType type = BlockType::Text;

  // Text
  std::string text;

  // ToolUse
  std::string id;
  std::string name;
  json input = json::object();

  // ToolResult
  std::string tool_use_id;
  std::string content;
  bool is_error = false;

  // Other: blocks we do not interpret (thinking, images, ...) pass through verbatim
  json raw;

  static ContentBlock text_block(std::string text);
  static ContentBlock tool_use(std::string id, std::string name, json input);
  static ContentBlock tool_result(std::string tool_use_id, std::string content, bool is_error = false);

  json to_json() const;
  static ContentBlock from_json(const json &j);
};

struct Message {
  Role role = Role::User;
  std::vector<ContentBlock> blocks;

  Message() = default;
  Message(Role r, std::vector<ContentBlock> b) : role(r), blocks(std::move(b)) {}

  static Message user(std::string text);
  static Message assistant(std::vector<ContentBlock> blocks);
  static Message tool_results(std::vector<ContentBlock> results);

  void add_text(std::string text);
  void add_tool_result(std::string tool_use_id, std::string content, bool is_error = false);

  std::vector<ContentBlock> tool_uses() const;

  // All text blocks joined with '\n'
  std::string text() const;

  // A lone text block from the user is written as a plain string, everything
  // else as a block array
  json to_json() const;
  static Message from_json(const json &j);
};

// Ordered message history. Supplied and returned whole every turn.
using Conversation = std::vector<Message>;

json conversation_to_json(const Conversation &conversation);

// Throws std::invalid_argument when the payload is not a message array
Conversation conversation_from_json(const json &j);

}  // namespace conductor

#include "core/message.hpp"

#include <stdexcept>

namespace conductor {

std::string to_string(Role role) {
  switch (role) {
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Role role_from_string(const std::string &s) {
  if (s == "user") return Role::User;
  if (s == "assistant") return Role::Assistant;
  throw std::invalid_argument("Unknown message role: " + s);
}

// ============================================================
// ContentBlock
// ============================================================

ContentBlock ContentBlock::text_block(std::string text) {
  ContentBlock b;
  b.type = BlockType::Text;
  b.text = std::move(text);
  return b;
}

ContentBlock ContentBlock::tool_use(std::string id, std::string name, json input) {
  ContentBlock b;
  b.type = BlockType::ToolUse;
  b.id = std::move(id);
  b.name = std::move(name);
  b.input = input.is_null() ? json::object() : std::move(input);
  return b;
}

ContentBlock ContentBlock::tool_result(std::string tool_use_id, std::string content, bool is_error) {
  ContentBlock b;
  b.type = BlockType::ToolResult;
  b.tool_use_id = std::move(tool_use_id);
  b.content = std::move(content);
  b.is_error = is_error;
  return b;
}

json ContentBlock::to_json() const {
  switch (type) {
    case BlockType::Text:
      return json{{"type", "text"}, {"text", text}};
    case BlockType::ToolUse:
      return json{{"type", "tool_use"}, {"id", id}, {"name", name}, {"input", input}};
    case BlockType::ToolResult: {
      json j{{"type", "tool_result"}, {"tool_use_id", tool_use_id}, {"content", content}};
      if (is_error) {
        j["is_error"] = true;
      }
      return j;
    }
    case BlockType::Other:
      return raw;
  }
  return raw;
}

ContentBlock ContentBlock::from_json(const json &j) {
  if (!j.is_object()) {
    throw std::invalid_argument("Content block must be an object");
  }
  std::string type = j.value("type", "");
  if (type == "text") {
    return text_block(j.value("text", ""));
  }
  if (type == "tool_use") {
    return tool_use(j.value("id", ""), j.value("name", ""), j.value("input", json::object()));
  }
  if (type == "tool_result") {
    // content may be a string or an array of text blocks
    std::string content;
    if (j.contains("content")) {
      const auto &c = j["content"];
      if (c.is_string()) {
        content = c.get<std::string>();
      } else if (c.is_array()) {
        for (const auto &part : c) {
          if (part.value("type", "") == "text") {
            if (!content.empty()) content += "\n";
            content += part.value("text", "");
          }
        }
      }
    }
    return tool_result(j.value("tool_use_id", ""), std::move(content), j.value("is_error", false));
  }

  ContentBlock b;
  b.type = BlockType::Other;
  b.raw = j;
  return b;
}

// ============================================================
// Message
// ============================================================

Message Message::user(std::string text) {
  return Message(Role::User, {ContentBlock::text_block(std::move(text))});
}

Message Message::assistant(std::vector<ContentBlock> blocks) {
  return Message(Role::Assistant, std::move(blocks));
}

Message Message::tool_results(std::vector<ContentBlock> results) {
  return Message(Role::User, std::move(results));
}

void Message::add_text(std::string text) {
  blocks.push_back(ContentBlock::text_block(std::move(text)));
}

void Message::add_tool_result(std::string tool_use_id, std::string content, bool is_error) {
  blocks.push_back(ContentBlock::tool_result(std::move(tool_use_id), std::move(content), is_error));
}

std::vector<ContentBlock> Message::tool_uses() const {
  std::vector<ContentBlock> uses;
  for (const auto &b : blocks) {
    if (b.type == BlockType::ToolUse) uses.push_back(b);
  }
  return uses;
}

std::string Message::text() const {
  std::string out;
  bool first = true;
  for (const auto &b : blocks) {
    if (b.type != BlockType::Text) continue;
    if (!first) out += "\n";
    out += b.text;
    first = false;
  }
  return out;
}

json Message::to_json() const {
  json j;
  j["role"] = to_string(role);
  if (role == Role::User && blocks.size() == 1 && blocks[0].type == BlockType::Text) {
    j["content"] = blocks[0].text;
    return j;
  }
  json content = json::array();
  for (const auto &b : blocks) {
    content.push_back(b.to_json());
  }
  j["content"] = std::move(content);
  return j;
}

Message Message::from_json(const json &j) {
  if (!j.is_object() || !j.contains("role")) {
    throw std::invalid_argument("Message must be an object with a role");
  }
  Message msg;
  msg.role = role_from_string(j["role"].get<std::string>());

  const auto &content = j.value("content", json());
  if (content.is_string()) {
    msg.blocks.push_back(ContentBlock::text_block(content.get<std::string>()));
  } else if (content.is_array()) {
    for (const auto &block : content) {
      msg.blocks.push_back(ContentBlock::from_json(block));
    }
  } else if (!content.is_null()) {
    throw std::invalid_argument("Message content must be a string or an array");
  }
  return msg;
}

json conversation_to_json(const Conversation &conversation) {
  json arr = json::array();
  for (const auto &m : conversation) {
    arr.push_back(m.to_json());
  }
  return arr;
}

Conversation conversation_from_json(const json &j) {
  if (j.is_null()) {
    return {};
  }
  if (!j.is_array()) {
    throw std::invalid_argument("Conversation history must be an array");
  }
  Conversation conversation;
  conversation.reserve(j.size());
  for (const auto &m : j) {
    conversation.push_back(Message::from_json(m));
  }
  return conversation;
}

}  // namespace conductor

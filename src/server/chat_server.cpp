#include "server/chat_server.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace conductor {

ChatServer::ChatServer(asio::io_context &io_ctx, const ServerConfig &config, const AgentLoop &loop,
                       const ToolRegistry &registry)
    : http_(io_ctx, config.host, config.port), loop_(loop), registry_(registry) {
  http_.route("POST", "/api/chat", [this](const net::HttpRequest &req, net::ResponseWriter &writer) {
    handle_chat(req, writer);
  });
  http_.route("GET", "/api/tools", [this](const net::HttpRequest &req, net::ResponseWriter &writer) {
    handle_tools(req, writer);
  });
  http_.route("GET", "/api/health", [this](const net::HttpRequest &req, net::ResponseWriter &writer) {
    handle_health(req, writer);
  });
}

ChatServer::~ChatServer() {
  stop();
}

void ChatServer::start() {
  http_.start();
}

void ChatServer::stop() {
  http_.stop();
  reap_turns(true);
}

std::size_t ChatServer::active_turns() {
  reap_turns(false);
  std::lock_guard<std::mutex> lock(turns_mutex_);
  return turns_.size();
}

void ChatServer::handle_chat(const net::HttpRequest &req, net::ResponseWriter &writer) {
  auto body = json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    writer.send_json(400, json{{"error", "Request body must be a JSON object"}});
    return;
  }
  if (!body.contains("message") || !body["message"].is_string() || body["message"].get<std::string>().empty()) {
    writer.send_json(400, json{{"error", "message is required"}});
    return;
  }

  Conversation history;
  try {
    history = conversation_from_json(body.value("history", json()));
  } catch (const std::exception &e) {
    writer.send_json(400, json{{"error", std::string("Invalid history: ") + e.what()}});
    return;
  }

  std::string message = body["message"].get<std::string>();
  auto events = std::make_shared<EventStream>();
  auto done = std::make_shared<std::atomic<bool>>(false);

  reap_turns(false);
  {
    std::lock_guard<std::mutex> lock(turns_mutex_);
    turns_.push_back(TurnWorker{std::thread([this, events, done, history = std::move(history), message]() {
                                  loop_.run_turn(history, message, *events);
                                  events->close();
                                  *done = true;
                                }),
                                done});
  }

  if (!writer.begin_stream()) {
    events->disconnect();
    return;
  }

  while (auto event = events->next()) {
    if (!writer.write_event(event->to_json())) {
      spdlog::info("[HTTP] Client left mid-turn; the turn keeps running");
      events->disconnect();
      return;
    }
  }
}

void ChatServer::handle_tools(const net::HttpRequest &, net::ResponseWriter &writer) {
  json tools = json::array();
  for (const auto &descriptor : registry_.snapshot()) {
    auto route = registry_.resolve(descriptor.name);
    json entry = descriptor.to_json();
    entry["provider"] = route.handle.name;
    tools.push_back(std::move(entry));
  }
  writer.send_json(200, json{{"tools", std::move(tools)}});
}

void ChatServer::handle_health(const net::HttpRequest &, net::ResponseWriter &writer) {
  writer.send_json(200, json{{"status", "ok"}, {"providers", registry_.providers().size()}, {"tools", registry_.size()}});
}

void ChatServer::reap_turns(bool all) {
  std::list<TurnWorker> finished;
  {
    std::lock_guard<std::mutex> lock(turns_mutex_);
    for (auto it = turns_.begin(); it != turns_.end();) {
      if (all || *it->done) {
        finished.push_back(std::move(*it));
        it = turns_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &turn : finished) {
    if (turn.thread.joinable()) {
      turn.thread.join();
    }
  }
}

}  // namespace conductor

#pragma once

#include <asio.hpp>
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "agent/agent_loop.hpp"
#include "core/config.hpp"
#include "net/http_server.hpp"
#include "tool/registry.hpp"

namespace conductor {

// Turn submission over HTTP:
//   POST /api/chat   {"message": string, "history": [...]} -> text/event-stream
//   GET  /api/tools  merged tool namespace
//   GET  /api/health provider and tool counts
//
// Each turn runs on its own thread and always runs to completion, even when
// the client goes away mid-stream.
class ChatServer {
 public:
  ChatServer(asio::io_context &io_ctx, const ServerConfig &config, const AgentLoop &loop, const ToolRegistry &registry);
  ~ChatServer();

  ChatServer(const ChatServer &) = delete;
  ChatServer &operator=(const ChatServer &) = delete;

  void start();

  // Stops accepting and waits for in-flight turns
  void stop();

  uint16_t port() const {
    return http_.port();
  }

  std::size_t active_turns();

 private:
  struct TurnWorker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void handle_chat(const net::HttpRequest &req, net::ResponseWriter &writer);
  void handle_tools(const net::HttpRequest &req, net::ResponseWriter &writer);
  void handle_health(const net::HttpRequest &req, net::ResponseWriter &writer);

  void reap_turns(bool all);

  net::HttpServer http_;
  const AgentLoop &loop_;
  const ToolRegistry &registry_;

  std::mutex turns_mutex_;
  std::list<TurnWorker> turns_;
};

}  // namespace conductor

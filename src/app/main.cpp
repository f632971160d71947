#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#include "conductor.hpp"

using namespace conductor;

namespace {

void print_usage(const char *argv0) {
  std::cout << "Usage: " << argv0 << " [--config <path>] [--port <port>]\n"
            << "\n"
            << "  --config <path>  configuration file (default: ./conductor.json,\n"
            << "                   then " << config_paths::config_dir().string() << "/config.json)\n"
            << "  --port <port>    HTTP port, overrides configuration and $PORT\n"
            << "  --version        print the version and exit\n"
            << "  --help           show this help\n";
}

std::optional<uint16_t> parse_port(const std::string &value) {
  try {
    std::size_t consumed = 0;
    int port = std::stoi(value, &consumed);
    if (consumed != value.size() || port < 0 || port > 65535) {
      return std::nullopt;
    }
    return static_cast<uint16_t>(port);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

}  // namespace

int main(int argc, char *argv[]) {
  // ===== Command line =====
  std::optional<std::string> config_path;
  std::optional<uint16_t> port;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "--version") {
      std::cout << "conductor " << version() << "\n";
      return 0;
    }
    if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      config_path = argv[++i];
    } else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
      port = parse_port(argv[++i]);
      if (!port) {
        std::cerr << "Invalid port: " << argv[i] << "\n";
        return 2;
      }
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    }
  }

  // ===== Configuration =====
  Config config;
  try {
    if (config_path) {
      config = Config::load(*config_path);
      config.apply_env();
    } else {
      config = Config::load_default();
    }
  } catch (const Error &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  if (port) {
    config.server.port = *port;
  }

  conductor::init(config);

  if (config.engine.api_key.empty()) {
    spdlog::warn("No API key configured; set ANTHROPIC_API_KEY or engine.api_key");
  }

  // ===== Event loop =====
  asio::io_context io_ctx;
  auto work = asio::make_work_guard(io_ctx);
  std::thread io_thread([&io_ctx]() { io_ctx.run(); });

  auto stop_io = [&]() {
    work.reset();
    io_ctx.stop();
    if (io_thread.joinable()) {
      io_thread.join();
    }
  };

  // ===== Providers =====
  ToolRegistry registry;
  mcp::ClientOptions client_options;
  client_options.request_timeout = std::chrono::milliseconds(config.discovery_timeout_ms);
  client_options.call_timeout = std::chrono::milliseconds(config.call_timeout_ms);
  mcp::ProcessSupervisor supervisor(registry, client_options);

  try {
    supervisor.start_all(config.mcp_servers);
  } catch (const StartupError &e) {
    spdlog::critical("Startup failed: {}", e.what());
    stop_io();
    return 1;
  }

  // ===== Engine =====
  auto engine = llm::EngineFactory::instance().create(config.engine.provider, config.engine, io_ctx);
  if (!engine) {
    spdlog::critical("Unknown engine provider: {}", config.engine.provider);
    supervisor.shutdown();
    stop_io();
    return 1;
  }

  AgentLoop loop(engine, registry, AgentOptions::from_config(config));

  // ===== HTTP =====
  std::unique_ptr<ChatServer> server;
  try {
    server = std::make_unique<ChatServer>(io_ctx, config.server, loop, registry);
  } catch (const std::system_error &e) {
    spdlog::critical("Cannot listen on {}:{}: {}", config.server.host, config.server.port, e.what());
    supervisor.shutdown();
    stop_io();
    return 1;
  }

  std::promise<int> stopped;
  auto stop_signal = stopped.get_future();
  asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
  signals.async_wait([&stopped](const asio::error_code &ec, int signo) {
    if (!ec) {
      spdlog::info("Received signal {}, shutting down", signo);
      stopped.set_value(signo);
    }
  });

  server->start();
  spdlog::info("conductor {} ready: {} tools from {} providers, model {}", version(), registry.size(),
               registry.providers().size(), config.engine.model);

  stop_signal.wait();

  // ===== Shutdown =====
  server->stop();
  server.reset();
  supervisor.shutdown();
  stop_io();
  return 0;
}

#pragma once

// Core types
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/message.hpp"
#include "core/types.hpp"

// Network
#include "net/http_client.hpp"
#include "net/http_server.hpp"

// Reasoning engine
#include "llm/anthropic.hpp"
#include "llm/provider.hpp"

// Tool routing
#include "tool/registry.hpp"
#include "tool/tool.hpp"

// MCP providers
#include "mcp/client.hpp"
#include "mcp/supervisor.hpp"

// Turn execution
#include "agent/agent_loop.hpp"
#include "agent/event_stream.hpp"
#include "server/chat_server.hpp"

namespace conductor {

// Initialize logging from the configuration
void init(const Config &config);

// Get version string
std::string version();

}  // namespace conductor

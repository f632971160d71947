#include "mcp/framing.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "core/errors.hpp"

namespace conductor::mcp {

std::string to_string(Framing framing) {
  switch (framing) {
    case Framing::ContentLength:
      return "content-length";
    case Framing::Newline:
      return "newline";
  }
  return "content-length";
}

Framing framing_from_string(const std::string &s) {
  if (s == "content-length") return Framing::ContentLength;
  if (s == "newline") return Framing::Newline;
  throw std::invalid_argument("Unknown framing '" + s + "' (expected content-length or newline)");
}

std::string encode_frame(const json &message, Framing framing) {
  std::string body = message.dump();
  if (framing == Framing::Newline) {
    return body + "\n";
  }
  return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

// ============================================================
// FrameDecoder
// ============================================================

std::vector<json> FrameDecoder::feed(const char *data, std::size_t size) {
  buffer_.append(data, size);

  std::vector<json> out;
  if (framing_ == Framing::Newline) {
    drain_newline(out);
  } else {
    drain_content_length(out);
  }
  return out;
}

namespace {

// Value of the Content-Length header in [0, header_end), or npos if absent
std::size_t find_content_length(const std::string &buffer, std::size_t header_end) {
  std::size_t line_start = 0;
  while (line_start < header_end) {
    std::size_t line_end = buffer.find("\r\n", line_start);
    if (line_end == std::string::npos || line_end > header_end) line_end = header_end;

    std::string line = buffer.substr(line_start, line_end - line_start);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
      std::string key = line.substr(0, colon);
      std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
      if (key == "content-length") {
        std::string value = line.substr(colon + 1);
        auto first = value.find_first_not_of(" \t");
        if (first == std::string::npos) return std::string::npos;
        try {
          return static_cast<std::size_t>(std::stoull(value.substr(first)));
        } catch (const std::exception &) {
          return std::string::npos;
        }
      }
    }
    line_start = line_end + 2;
  }
  return std::string::npos;
}

}  // namespace

void FrameDecoder::drain_content_length(std::vector<json> &out) {
  while (true) {
    auto header_end = buffer_.find("\r\n\r\n");
    if (header_end == std::string::npos) {
      if (buffer_.size() > kMaxFrameBytes) {
        throw TransportError("Frame header exceeds " + std::to_string(kMaxFrameBytes) + " bytes");
      }
      return;
    }

    auto content_length = find_content_length(buffer_, header_end);
    if (content_length == std::string::npos) {
      // Malformed header, skip past it
      spdlog::warn("[MCP] Dropping frame without a valid Content-Length header");
      buffer_.erase(0, header_end + 4);
      continue;
    }
    if (content_length > kMaxFrameBytes) {
      throw TransportError("Frame of " + std::to_string(content_length) + " bytes exceeds the limit");
    }

    std::size_t body_start = header_end + 4;
    if (buffer_.size() < body_start + content_length) {
      return;  // wait for the rest of the body
    }

    std::string body = buffer_.substr(body_start, content_length);
    buffer_.erase(0, body_start + content_length);
    parse_body(body, out);
  }
}

void FrameDecoder::drain_newline(std::vector<json> &out) {
  std::size_t pos;
  while ((pos = buffer_.find('\n')) != std::string::npos) {
    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;
    parse_body(line, out);
  }
  if (buffer_.size() > kMaxFrameBytes) {
    throw TransportError("Line exceeds " + std::to_string(kMaxFrameBytes) + " bytes");
  }
}

void FrameDecoder::parse_body(const std::string &body, std::vector<json> &out) {
  try {
    out.push_back(json::parse(body));
  } catch (const json::parse_error &e) {
    spdlog::warn("[MCP] Failed to parse JSON message: {}", e.what());
  }
}

}  // namespace conductor::mcp

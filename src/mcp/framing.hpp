#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace conductor::mcp {

using json = nlohmann::json;

// How JSON-RPC messages are delimited on a provider's byte stream
enum class Framing {
  ContentLength,  // "Content-Length: N\r\n\r\n" header, then N bytes of body
  Newline,        // one JSON document per line
};

std::string to_string(Framing framing);

// Accepts "content-length" and "newline"; throws std::invalid_argument otherwise
Framing framing_from_string(const std::string &s);

constexpr std::size_t kMaxFrameBytes = 16 * 1024 * 1024;

std::string encode_frame(const json &message, Framing framing);

// Incremental decoder: bytes go in as they arrive from the pipe, complete
// JSON documents come out in stream order
class FrameDecoder {
 public:
  explicit FrameDecoder(Framing framing) : framing_(framing) {}

  // Throws TransportError when a frame exceeds kMaxFrameBytes. A body that is
  // not valid JSON is logged and skipped.
  std::vector<json> feed(const char *data, std::size_t size);

  std::size_t buffered() const {
    return buffer_.size();
  }

 private:
  void drain_content_length(std::vector<json> &out);
  void drain_newline(std::vector<json> &out);
  void parse_body(const std::string &body, std::vector<json> &out);

  Framing framing_;
  std::string buffer_;
};

}  // namespace conductor::mcp

#include "mcp/transport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

#include "core/errors.hpp"

namespace conductor::mcp {

// ============================================================
// JSON-RPC 2.0 serialization
// ============================================================

json JsonRpcRequest::to_json() const {
  json j;
  j["jsonrpc"] = "2.0";
  j["method"] = method;
  j["id"] = id;
  if (!params.empty()) {
    j["params"] = params;
  }
  return j;
}

std::string JsonRpcResponse::error_message() const {
  if (!error.has_value()) return "";
  auto &err = error.value();
  if (err.is_object() && err.contains("message") && err["message"].is_string()) {
    return err["message"].get<std::string>();
  }
  return err.dump();
}

JsonRpcResponse JsonRpcResponse::from_json(const json &j) {
  JsonRpcResponse resp;
  if (j.contains("id") && j["id"].is_number_integer()) {
    resp.id = j["id"].get<int64_t>();
  }
  if (j.contains("result")) {
    resp.result = j["result"];
  }
  if (j.contains("error")) {
    resp.error = j["error"];
  }
  return resp;
}

json JsonRpcNotification::to_json() const {
  json j;
  j["jsonrpc"] = "2.0";
  j["method"] = method;
  if (!params.empty()) {
    j["params"] = params;
  }
  return j;
}

std::string to_string(TransportState state) {
  switch (state) {
    case TransportState::Disconnected:
      return "Disconnected";
    case TransportState::Connecting:
      return "Connecting";
    case TransportState::Connected:
      return "Connected";
    case TransportState::Failed:
      return "Failed";
  }
  return "Unknown";
}

// ============================================================
// StdioTransport::Impl: POSIX child process
// ============================================================

namespace {

std::string describe_status(int status) {
  if (WIFEXITED(status)) {
    return "exit code " + std::to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return "signal " + std::to_string(WTERMSIG(status));
  }
  return "status " + std::to_string(status);
}

void ignore_sigpipe_once() {
  // A provider that dies mid-write must surface as EPIPE, not kill us
  static std::once_flag flag;
  std::call_once(flag, []() {
    std::signal(SIGPIPE, SIG_IGN);
  });
}

}  // namespace

class StdioTransport::Impl {
 public:
  Impl(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env, StdioOptions options)
      : command_(std::move(command)),
        args_(std::move(args)),
        env_(std::move(env)),
        options_(options),
        decoder_(options.framing) {
    ignore_sigpipe_once();
  }

  ~Impl() {
    disconnect();
  }

  void connect() {
    std::lock_guard<std::mutex> lock(process_mutex_);

    if (state_ == TransportState::Connected) return;
    state_ = TransportState::Connecting;

    // Create pipes: parent writes to child stdin, reads from child stdout.
    // exec_pipe reports an exec failure back to the parent; it closes on a
    // successful exec thanks to O_CLOEXEC.
    int stdin_pipe[2];
    int stdout_pipe[2];
    int exec_pipe[2];

    if (pipe(stdin_pipe) != 0) {
      fail_connect(std::string("Failed to create pipes: ") + std::strerror(errno));
    }
    if (pipe(stdout_pipe) != 0) {
      int err = errno;
      close(stdin_pipe[0]);
      close(stdin_pipe[1]);
      fail_connect(std::string("Failed to create pipes: ") + std::strerror(err));
    }
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
      int err = errno;
      for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1]}) close(fd);
      fail_connect(std::string("Failed to create pipes: ") + std::strerror(err));
    }

    // Build argv before forking
    std::vector<const char *> argv;
    argv.push_back(command_.c_str());
    for (const auto &arg : args_) {
      argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
      int err = errno;
      for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1], exec_pipe[0], exec_pipe[1]}) close(fd);
      fail_connect(std::string("Fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
      // Child process
      close(stdin_pipe[1]);
      close(stdout_pipe[0]);
      close(exec_pipe[0]);

      dup2(stdin_pipe[0], STDIN_FILENO);
      dup2(stdout_pipe[1], STDOUT_FILENO);

      close(stdin_pipe[0]);
      close(stdout_pipe[1]);

      if (!options_.forward_stderr) {
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
          dup2(devnull, STDERR_FILENO);
          close(devnull);
        }
      }

      for (const auto &[key, val] : env_) {
        setenv(key.c_str(), val.c_str(), 1);
      }

      execvp(command_.c_str(), const_cast<char *const *>(argv.data()));

      int err = errno;
      ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
      (void)ignored;
      _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
      n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
      close(stdin_pipe[1]);
      close(stdout_pipe[0]);
      int status = 0;
      waitpid(pid, &status, 0);
      fail_connect("Failed to execute '" + command_ + "': " + std::strerror(exec_errno));
    }

    {
      std::lock_guard<std::mutex> reap_lock(reap_mutex_);
      pid_ = pid;
      exit_status_.reset();
    }
    write_fd_ = stdin_pipe[1];
    read_fd_ = stdout_pipe[0];

    stopped_ = false;
    {
      std::lock_guard<std::mutex> pending_lock(pending_mutex_);
      accepting_ = true;
      state_ = TransportState::Connected;
    }

    reader_thread_ = std::thread([this]() {
      reader_loop();
    });

    spdlog::info("[MCP] Stdio transport connected to '{}' (pid: {}, framing: {})", command_, pid, to_string(options_.framing));
  }

  void disconnect() {
    stopped_ = true;

    {
      std::lock_guard<std::mutex> lock(write_mutex_);
      if (write_fd_ >= 0) {
        close(write_fd_);
        write_fd_ = -1;
      }
    }

    terminate_child();

    if (reader_thread_.joinable()) {
      reader_thread_.join();
    }

    if (read_fd_ >= 0) {
      close(read_fd_);
      read_fd_ = -1;
    }

    fail_pending("Transport disconnected");

    if (state_ != TransportState::Failed) {
      state_ = TransportState::Disconnected;
    }
  }

  std::future<JsonRpcResponse> send_request(const JsonRpcRequest &request) {
    std::promise<JsonRpcResponse> promise;
    auto future = promise.get_future();

    {
      // Checked under the same lock fail_pending() takes, so a request is
      // either failed by it or rejected here, never left waiting
      std::lock_guard<std::mutex> lock(pending_mutex_);
      if (!accepting_ || state_ != TransportState::Connected) {
        promise.set_exception(std::make_exception_ptr(TransportError("Transport to '" + command_ + "' is not connected")));
        return future;
      }
      pending_requests_[request.id] = std::move(promise);
    }

    try {
      write_message(request.to_json());
    } catch (const TransportError &) {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      auto it = pending_requests_.find(request.id);
      if (it != pending_requests_.end()) {
        it->second.set_exception(std::current_exception());
        pending_requests_.erase(it);
      }
    }
    return future;
  }

  void send_notification(const JsonRpcNotification &notification) {
    if (state_ != TransportState::Connected) {
      throw TransportError("Transport to '" + command_ + "' is not connected");
    }
    write_message(notification.to_json());
  }

  void abandon(int64_t id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_requests_.erase(id);
  }

  void set_notification_handler(Transport::NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_handler_ = std::move(handler);
  }

  TransportState state() const {
    return state_;
  }

  int pid() const {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    return pid_;
  }

  std::optional<int> exit_status() const {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    return exit_status_;
  }

 private:
  [[noreturn]] void fail_connect(const std::string &message) {
    spdlog::error("[MCP] {}", message);
    state_ = TransportState::Failed;
    throw TransportError(message);
  }

  void write_message(const json &msg) {
    std::string frame = encode_frame(msg, options_.framing);

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_fd_ < 0) {
      throw TransportError("Transport to '" + command_ + "' is closed");
    }
    std::size_t offset = 0;
    while (offset < frame.size()) {
      ssize_t written = write(write_fd_, frame.data() + offset, frame.size() - offset);
      if (written < 0) {
        if (errno == EINTR) continue;
        std::string reason = std::strerror(errno);
        spdlog::error("[MCP] Write to '{}' failed: {}", command_, reason);
        state_ = TransportState::Failed;
        throw TransportError("Write to '" + command_ + "' failed: " + reason);
      }
      offset += static_cast<std::size_t>(written);
    }
  }

  void reader_loop() {
    std::array<char, 4096> read_buf;

    while (!stopped_) {
      pollfd pfd{read_fd_, POLLIN, 0};
      int ready = poll(&pfd, 1, 100);
      if (ready < 0) {
        if (errno == EINTR) continue;
        break;
      }
      if (ready == 0) continue;

      ssize_t n = read(read_fd_, read_buf.data(), read_buf.size());
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) {
        if (!stopped_) {
          handle_eof();
        }
        break;
      }

      std::vector<json> messages;
      try {
        messages = decoder_.feed(read_buf.data(), static_cast<std::size_t>(n));
      } catch (const TransportError &e) {
        spdlog::error("[MCP] Protocol error from '{}': {}", command_, e.what());
        fail_pending(e.what(), TransportState::Failed);
        break;
      }

      for (const auto &msg : messages) {
        handle_incoming(msg);
      }
    }
  }

  void handle_eof() {
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      accepting_ = false;
      state_ = TransportState::Failed;
    }

    // Give the child a moment to finish exiting so the status can be reported
    std::string reason = "Provider '" + command_ + "' closed its output";
    for (int i = 0; i < 10; ++i) {
      if (reap(false)) break;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (auto status = exit_status()) {
      reason = "Provider '" + command_ + "' exited with " + describe_status(*status);
    }
    spdlog::warn("[MCP] {}", reason);
    fail_pending(reason, TransportState::Failed);
  }

  void handle_incoming(const json &msg) {
    if (!msg.is_object()) return;

    // Response: has an id and either result or error
    if (msg.contains("id") && !msg["id"].is_null() && (msg.contains("result") || msg.contains("error"))) {
      auto resp = JsonRpcResponse::from_json(msg);
      std::lock_guard<std::mutex> lock(pending_mutex_);
      auto it = pending_requests_.find(resp.id);
      if (it != pending_requests_.end()) {
        it->second.set_value(std::move(resp));
        pending_requests_.erase(it);
      } else {
        spdlog::debug("[MCP] Dropping response with unknown id {}", resp.id);
      }
      return;
    }

    // Notification (no id, has a method)
    if (msg.contains("method") && msg["method"].is_string()) {
      std::string method = msg["method"].get<std::string>();
      json params = msg.value("params", json::object());

      std::lock_guard<std::mutex> lock(handler_mutex_);
      if (notification_handler_) {
        notification_handler_(method, params);
      }
    }
  }

  // Stops accepting requests and fails every pending one. A given state is
  // published under the same lock.
  void fail_pending(const std::string &reason, std::optional<TransportState> state = std::nullopt) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    accepting_ = false;
    if (state) {
      state_ = *state;
    }
    for (auto &[id, promise] : pending_requests_) {
      promise.set_exception(std::make_exception_ptr(TransportError(reason)));
    }
    pending_requests_.clear();
  }

  // Returns true once the child has been reaped (now or earlier)
  bool reap(bool block) {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (pid_ <= 0) return true;
    int status = 0;
    pid_t r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
      if (r == pid_) exit_status_ = status;
      pid_ = -1;
      return true;
    }
    return false;
  }

  void terminate_child() {
    pid_t pid = this->pid();
    if (pid <= 0) return;

    kill(pid, SIGTERM);
    for (int i = 0; i < 10; ++i) {
      if (reap(false)) return;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    kill(pid, SIGKILL);
    reap(true);
  }

  std::string command_;
  std::vector<std::string> args_;
  std::map<std::string, std::string> env_;
  StdioOptions options_;
  FrameDecoder decoder_;

  mutable std::mutex reap_mutex_;
  pid_t pid_ = -1;
  std::optional<int> exit_status_;

  int write_fd_ = -1;
  int read_fd_ = -1;

  std::atomic<TransportState> state_{TransportState::Disconnected};
  std::atomic<bool> stopped_{false};

  std::thread reader_thread_;

  std::mutex write_mutex_;
  std::mutex process_mutex_;

  std::mutex pending_mutex_;
  std::unordered_map<int64_t, std::promise<JsonRpcResponse>> pending_requests_;
  bool accepting_ = false;  // guarded by pending_mutex_

  std::mutex handler_mutex_;
  Transport::NotificationHandler notification_handler_;
};

// ============================================================
// StdioTransport: delegates to Impl
// ============================================================

StdioTransport::StdioTransport(std::string command, std::vector<std::string> args, std::map<std::string, std::string> env,
                               StdioOptions options)
    : impl_(std::make_unique<Impl>(std::move(command), std::move(args), std::move(env), options)) {}

StdioTransport::~StdioTransport() = default;

std::future<JsonRpcResponse> StdioTransport::send_request(const JsonRpcRequest &request) {
  return impl_->send_request(request);
}

void StdioTransport::send_notification(const JsonRpcNotification &notification) {
  impl_->send_notification(notification);
}

void StdioTransport::abandon(int64_t id) {
  impl_->abandon(id);
}

void StdioTransport::set_notification_handler(NotificationHandler handler) {
  impl_->set_notification_handler(std::move(handler));
}

void StdioTransport::connect() {
  impl_->connect();
}

void StdioTransport::disconnect() {
  impl_->disconnect();
}

TransportState StdioTransport::state() const {
  return impl_->state();
}

int StdioTransport::pid() const {
  return impl_->pid();
}

std::optional<int> StdioTransport::exit_status() const {
  return impl_->exit_status();
}

}  // namespace conductor::mcp

#include "mcp_server.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

#include "log.h"

namespace kitrun {

namespace {

using json = nlohmann::json;

static constexpr int kClientIoTimeoutSec = 10;

const char *status_text(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    default: return "Error";
  }
}

bool send_all(int fd, const std::string &data) {
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n <= 0) {
      if (n < 0 && errno == EINTR) continue;
      return false;
    }
    off += (size_t)n;
  }
  return true;
}

void reply(int fd, int status, const std::string &body) {
  if (!send_all(fd, BuildHttpResponse(status, body))) {
    log_event("MCP_SEND_FAILED", 0, std::to_string(status) + " " + std::strerror(errno));
  }
}

std::string trim(const std::string &s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace((unsigned char)s[b])) ++b;
  while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string lower(std::string s) {
  for (char &c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

bool constant_time_equals(const std::string &a, const std::string &b) {
  if (a.size() != b.size()) return false;
  unsigned char diff = 0;
  for (size_t i = 0; i < a.size(); ++i) diff |= (unsigned char)(a[i] ^ b[i]);
  return diff == 0;
}

bool write_private_file(const std::string &path, const std::string &data, KitError *error) {
  const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) return set_err(error, KitErrorCode::IoError, "Failed to open " + path + ": " + std::strerror(errno));
  fchmod(fd, 0600);
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = write(fd, data.data() + off, data.size() - off);
    if (n <= 0) {
      if (n < 0 && errno == EINTR) continue;
      const int e = errno;
      close(fd);
      return set_err(error, KitErrorCode::IoError, "Failed to write " + path + ": " + std::strerror(e));
    }
    off += (size_t)n;
  }
  close(fd);
  return true;
}

bool ensure_dir(const std::string &dir, KitError *error) {
  if (dir.empty()) return true;
  std::string partial;
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = dir.find('/', pos + 1);
    partial = dir.substr(0, pos);
    if (partial.empty()) continue;
    if (mkdir(partial.c_str(), 0700) != 0 && errno != EEXIST) {
      return set_err(error, KitErrorCode::IoError, "Failed to create " + partial + ": " + std::strerror(errno));
    }
  }
  return true;
}

}  // namespace

bool ReadHttpRequest(int fd, HttpRequest *out, int *status, std::string *error) {
  std::string buf;
  size_t header_end = std::string::npos;
  char chunk[4096];
  while (header_end == std::string::npos) {
    const ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      *status = 400;
      if (error) *error = n == 0 ? "connection closed before headers" : std::string("recv failed: ") + std::strerror(errno);
      return false;
    }
    buf.append(chunk, (size_t)n);
    header_end = buf.find("\r\n\r\n");
    if (header_end == std::string::npos && buf.size() > kMaxHttpHeaderBytes) {
      *status = 431;
      if (error) *error = "request headers too large";
      return false;
    }
  }

  std::istringstream head(buf.substr(0, header_end));
  std::string request_line;
  std::getline(head, request_line);
  if (!request_line.empty() && request_line.back() == '\r') request_line.pop_back();
  std::istringstream rl(request_line);
  std::string version;
  rl >> out->method >> out->path >> version;
  if (out->method.empty() || out->path.empty() || version.compare(0, 5, "HTTP/") != 0) {
    *status = 400;
    if (error) *error = "invalid request line";
    return false;
  }
  const size_t query = out->path.find('?');
  if (query != std::string::npos) out->path.resize(query);

  std::string line;
  while (std::getline(head, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const size_t colon = line.find(':');
    if (colon == std::string::npos) continue;
    out->headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }

  auto cl = out->headers.find("content-length");
  if (cl != out->headers.end()) {
    char *end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(cl->second.c_str(), &end, 10);
    if (errno == 0 && end != cl->second.c_str() && *end == '\0') {
      out->has_content_length = true;
      out->content_length = (size_t)v;
    }
  }
  if (!out->has_content_length) return true;
  if (out->content_length > kMaxHttpBodyBytes) {
    *status = 413;
    if (error) *error = "request body too large";
    return false;
  }

  out->body = buf.substr(header_end + 4);
  while (out->body.size() < out->content_length) {
    const ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      *status = 400;
      if (error) *error = "connection closed before body was complete";
      return false;
    }
    out->body.append(chunk, (size_t)n);
  }
  out->body.resize(out->content_length);
  return true;
}

std::string BuildHttpResponse(int status, const std::string &body, const std::string &content_type) {
  std::string out = "HTTP/1.1 " + std::to_string(status) + " " + status_text(status) + "\r\n";
  out += "Content-Type: " + content_type + "\r\n";
  out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  out += "Connection: close\r\n\r\n";
  out += body;
  return out;
}

bool GenerateToken(std::string *token, KitError *error) {
  unsigned char bytes[32];
  const int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) return set_err(error, KitErrorCode::IoError, std::string("open /dev/urandom: ") + std::strerror(errno));
  size_t got = 0;
  while (got < sizeof(bytes)) {
    const ssize_t n = read(fd, bytes + got, sizeof(bytes) - got);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      close(fd);
      return set_err(error, KitErrorCode::IoError, "short read from /dev/urandom");
    }
    got += (size_t)n;
  }
  close(fd);
  static const char kHex[] = "0123456789abcdef";
  token->clear();
  for (unsigned char b : bytes) {
    token->push_back(kHex[b >> 4]);
    token->push_back(kHex[b & 0x0f]);
  }
  return true;
}

bool LoadOrCreateToken(const std::string &path, std::string *token, KitError *error) {
  std::ifstream in(path);
  if (in) {
    std::stringstream ss;
    ss << in.rdbuf();
    *token = trim(ss.str());
    if (!token->empty()) {
      log_event("MCP_TOKEN_LOADED", 0, path);
      return true;
    }
  }
  const size_t slash = path.find_last_of('/');
  if (slash != std::string::npos && !ensure_dir(path.substr(0, slash), error)) return false;
  if (!GenerateToken(token, error)) return false;
  if (!write_private_file(path, *token, error)) return false;
  log_event("MCP_TOKEN_CREATED", 0, path);
  return true;
}

bool WriteDiscoveryFile(const std::string &path, const json &info, KitError *error) {
  return write_private_file(path, info.dump(2) + "\n", error);
}

McpServer::McpServer(const KitConfig &config, McpDispatcher *dispatcher)
    : config_(config), dispatcher_(dispatcher), running_(false), listen_fd_(-1), port_(config.port) {}

McpServer::~McpServer() { Stop(); }

std::string McpServer::url() const {
  return "http://" + config_.bind_host + ":" + std::to_string(port_);
}

bool McpServer::Start(KitError *error) {
  if (running_) return true;
  if (!dispatcher_) return set_err(error, KitErrorCode::InvalidArgument, "McpServer has no dispatcher.");
  if (!ensure_dir(config_.kit_path, error)) return false;
  if (!LoadOrCreateToken(config_.kit_path + "/agent-token", &token_, error)) return false;

  listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) return set_err(error, KitErrorCode::IoError, std::string("socket failed: ") + std::strerror(errno));
  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(config_.port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (bind(listen_fd_, (struct sockaddr *)&addr, sizeof(addr)) != 0) {
    const int e = errno;
    close(listen_fd_);
    listen_fd_ = -1;
    return set_err(error, KitErrorCode::IoError,
                   "bind 127.0.0.1:" + std::to_string(config_.port) + " failed: " + std::strerror(e));
  }
  if (listen(listen_fd_, SOMAXCONN) != 0) {
    const int e = errno;
    close(listen_fd_);
    listen_fd_ = -1;
    return set_err(error, KitErrorCode::IoError, std::string("listen failed: ") + std::strerror(e));
  }
  socklen_t len = sizeof(addr);
  if (getsockname(listen_fd_, (struct sockaddr *)&addr, &len) == 0) port_ = ntohs(addr.sin_port);

  const json discovery = {
      {"url", url()},
      {"port", port_},
      {"token", token_},
      {"version", kKitrunVersion},
      {"capabilities", {{"tools", true}, {"resources", true}, {"prompts", false}}},
  };
  if (!WriteDiscoveryFile(discovery_path(), discovery, error)) {
    close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  running_ = true;
  accept_thread_ = std::thread(&McpServer::ServerLoop, this);
  log_event("MCP_LISTENING", 0, url());
  return true;
}

void McpServer::Stop() {
  if (!running_.exchange(false)) return;
  if (accept_thread_.joinable()) accept_thread_.join();
  if (listen_fd_ >= 0) {
    close(listen_fd_);
    listen_fd_ = -1;
  }
  ReapWorkers(true);
  if (unlink(discovery_path().c_str()) != 0 && errno != ENOENT) {
    log_event("MCP_DISCOVERY_REMOVE_FAILED", 0, std::strerror(errno));
  }
  log_event("MCP_STOPPED", 0);
}

void McpServer::ReapWorkers(bool all) {
  std::vector<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mu_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (all || it->done->load()) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (Worker &w : finished) {
    if (w.thread.joinable()) w.thread.join();
  }
}

void McpServer::ServerLoop() {
  while (running_) {
    struct pollfd pfd;
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int rc = poll(&pfd, 1, 200);
    if (rc < 0) {
      if (errno == EINTR) continue;
      log_event("MCP_POLL_FAILED", 0, std::strerror(errno));
      break;
    }
    ReapWorkers(false);
    if (rc == 0) continue;

    const int client = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client < 0) {
      if (running_ && errno != EINTR && errno != EAGAIN) log_event("MCP_ACCEPT_FAILED", 0, std::strerror(errno));
      continue;
    }
    struct timeval tv;
    tv.tv_sec = kClientIoTimeoutSec;
    tv.tv_usec = 0;
    setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    Worker w;
    w.done = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<bool>> done = w.done;
    w.thread = std::thread([this, client, done]() {
      HandleClient(client);
      close(client);
      done->store(true);
    });
    std::lock_guard<std::mutex> lock(workers_mu_);
    workers_.push_back(std::move(w));
  }
}

bool McpServer::Authorized(const HttpRequest &request) const {
  auto it = request.headers.find("authorization");
  if (it == request.headers.end()) return false;
  const std::string prefix = "Bearer ";
  if (it->second.compare(0, prefix.size(), prefix) != 0) return false;
  return constant_time_equals(trim(it->second.substr(prefix.size())), token_);
}

void McpServer::HandleClient(int fd) {
  HttpRequest request;
  int status = 400;
  std::string error;
  if (!ReadHttpRequest(fd, &request, &status, &error)) {
    log_event("MCP_HTTP_REJECTED", 0, error);
    reply(fd, status, json{{"error", error}}.dump());
    return;
  }
  log_event("MCP_HTTP", 0, request.method + " " + request.path);

  if (request.method == "GET" && request.path == "/health") {
    reply(fd, 200, "{\"status\":\"healthy\"}");
    return;
  }
  if (!Authorized(request)) {
    log_event("MCP_AUTH_FAILED", 0, request.method + " " + request.path);
    reply(fd, 401, "{\"error\":\"Invalid or missing token\"}");
    return;
  }
  if (request.method == "GET" && request.path == "/") {
    reply(fd, 200, dispatcher_->ServerInfo().dump());
    return;
  }
  if (request.path == "/rpc") {
    if (request.method != "POST") {
      reply(fd, 405, "{\"error\":\"Use POST for /rpc\"}");
      return;
    }
    if (!request.has_content_length || request.content_length == 0) {
      const json body = MakeRpcError(nullptr, rpc_error::kInvalidRequest, "Missing or invalid Content-Length header");
      reply(fd, 400, body.dump());
      return;
    }
    log_event("MCP_RPC_BODY", 0, summarize_payload(request.body));
    const json response = dispatcher_->HandleBody(request.body);
    reply(fd, 200, response.dump(-1, ' ', false, json::error_handler_t::replace));
    return;
  }
  reply(fd, 404, "{\"error\":\"Endpoint not found\"}");
}

}  // namespace kitrun

#ifndef KITRUN_MCP_SERVER_H_
#define KITRUN_MCP_SERVER_H_

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "kit_config.h"
#include "kit_protocol.h"
#include "mcp_protocol.h"

namespace kitrun {

struct HttpRequest {
  std::string method;
  std::string path;
  std::map<std::string, std::string> headers;  // lower-case names
  std::string body;
  bool has_content_length = false;
  size_t content_length = 0;
};

// Reads the request line and headers, then the body when Content-Length is
// present. On failure `status` is the HTTP status to answer with.
bool ReadHttpRequest(int fd, HttpRequest *out, int *status, std::string *error);
std::string BuildHttpResponse(int status, const std::string &body,
                              const std::string &content_type = "application/json");

// 32 random bytes from /dev/urandom, hex encoded.
bool GenerateToken(std::string *token, KitError *error);
// Reads `path` or, when missing or empty, writes a fresh token with mode 0600.
bool LoadOrCreateToken(const std::string &path, std::string *token, KitError *error);
bool WriteDiscoveryFile(const std::string &path, const nlohmann::json &info, KitError *error);

// Loopback HTTP front end for the JSON-RPC dispatcher. One accept thread,
// one worker thread per connection, one request per connection.
class McpServer {
 public:
  McpServer(const KitConfig &config, McpDispatcher *dispatcher);
  ~McpServer();

  McpServer(const McpServer &) = delete;
  McpServer &operator=(const McpServer &) = delete;

  bool Start(KitError *error);
  void Stop();
  bool running() const { return running_.load(); }
  uint16_t port() const { return port_; }
  const std::string &token() const { return token_; }
  std::string url() const;
  std::string discovery_path() const { return config_.kit_path + "/server.json"; }

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void ServerLoop();
  void HandleClient(int fd);
  void ReapWorkers(bool all);
  bool Authorized(const HttpRequest &request) const;

  KitConfig config_;
  McpDispatcher *dispatcher_;
  std::atomic<bool> running_;
  int listen_fd_;
  uint16_t port_;
  std::string token_;
  std::thread accept_thread_;
  std::mutex workers_mu_;
  std::vector<Worker> workers_;
};

}  // namespace kitrun

#endif  // KITRUN_MCP_SERVER_H_

// mcp_server_test.cpp
//
// End-to-end test of the MCP HTTP endpoint.
//
// Exercises the full path:
//   raw HTTP over loopback
//     -> McpServer auth and routing
//       -> McpDispatcher JSON-RPC
//         -> script tool run through ScriptExecutor (/bin/sh)
//           -> audit log line

#include <arpa/inet.h>
#include <netinet/in.h>
#include <stdlib.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "audit_log.h"
#include "kit_config.h"
#include "mcp_protocol.h"
#include "mcp_server.h"
#include "script_catalog.h"
#include "script_executor.h"
#include "slot_table.h"

namespace {

using json = nlohmann::json;

static int g_pass = 0;
static int g_fail = 0;

bool require(bool cond, const char *label) {
  if (cond) {
    std::cout << "  PASS: " << label << "\n";
    ++g_pass;
  } else {
    std::cout << "  FAIL: " << label << "\n";
    ++g_fail;
  }
  return cond;
}

std::string g_dir;

std::string write_file(const std::string &name, const std::string &body, mode_t mode) {
  const std::string path = g_dir + "/" + name;
  std::ofstream out(path);
  out << body;
  out.close();
  chmod(path.c_str(), mode);
  return path;
}

std::string read_file(const std::string &path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

struct HttpReply {
  int status = 0;
  std::string body;
};

bool http_raw(uint16_t port, const std::string &request, HttpReply *out) {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return false;
  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (connect(fd, (struct sockaddr *)&addr, sizeof(addr)) != 0) {
    close(fd);
    return false;
  }
  size_t off = 0;
  while (off < request.size()) {
    const ssize_t n = send(fd, request.data() + off, request.size() - off, MSG_NOSIGNAL);
    if (n <= 0) {
      close(fd);
      return false;
    }
    off += (size_t)n;
  }
  std::string raw;
  char buf[4096];
  while (true) {
    const ssize_t n = recv(fd, buf, sizeof(buf), 0);
    if (n <= 0) break;
    raw.append(buf, (size_t)n);
  }
  close(fd);
  if (raw.compare(0, 9, "HTTP/1.1 ") != 0) return false;
  out->status = std::atoi(raw.c_str() + 9);
  const size_t split = raw.find("\r\n\r\n");
  out->body = split == std::string::npos ? "" : raw.substr(split + 4);
  return true;
}

HttpReply http_get(uint16_t port, const std::string &path, const std::string &token) {
  std::string req = "GET " + path + " HTTP/1.1\r\nHost: 127.0.0.1\r\n";
  if (!token.empty()) req += "Authorization: Bearer " + token + "\r\n";
  req += "\r\n";
  HttpReply reply;
  http_raw(port, req, &reply);
  return reply;
}

HttpReply http_post(uint16_t port, const std::string &body, const std::string &token) {
  std::string req = "POST /rpc HTTP/1.1\r\nHost: 127.0.0.1\r\nContent-Type: application/json\r\n";
  req += "Authorization: Bearer " + token + "\r\n";
  req += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
  HttpReply reply;
  http_raw(port, req, &reply);
  return reply;
}

json parse_body(const HttpReply &reply) {
  const json parsed = json::parse(reply.body, nullptr, false);
  return parsed.is_discarded() ? json::object() : parsed;
}

json rpc(uint16_t port, const std::string &token, const std::string &method, const json &params) {
  const json request = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", method}, {"params", params}};
  return parse_body(http_post(port, request.dump(), token));
}

int error_code(const json &response) {
  if (!response.is_object() || !response.contains("error")) return 0;
  return response["error"].value("code", 0);
}

static const char kGreetBody[] =
    "#!/bin/sh\n"
    "echo '{\"type\":\"arg\",\"id\":\"1\",\"placeholder\":\"Name?\",\"choices\":[]}'\n"
    "read reply\n"
    "name=$(printf '%s' \"$reply\" | sed -e 's/.*\"value\":\"\\([^\"]*\\)\".*/\\1/')\n"
    "echo \"{\\\"type\\\":\\\"scriptOutput\\\",\\\"data\\\":{\\\"greeting\\\":\\\"Hello $name\\\",\\\"debug\\\":1}}\"\n"
    "exit 0\n";

// Second prompt is optional: a null answer falls back to "plain".
static const char kStyledBody[] =
    "#!/bin/sh\n"
    "echo '{\"type\":\"arg\",\"id\":\"1\",\"placeholder\":\"Name?\",\"choices\":[]}'\n"
    "read reply\n"
    "name=$(printf '%s' \"$reply\" | sed -e 's/.*\"value\":\"\\([^\"]*\\)\".*/\\1/')\n"
    "echo '{\"type\":\"arg\",\"id\":\"2\",\"placeholder\":\"Style?\",\"choices\":[]}'\n"
    "read reply\n"
    "case \"$reply\" in\n"
    "  *'\"value\":null'*) style=plain ;;\n"
    "  *) style=$(printf '%s' \"$reply\" | sed -e 's/.*\"value\":\"\\([^\"]*\\)\".*/\\1/') ;;\n"
    "esac\n"
    "echo \"{\\\"type\\\":\\\"scriptOutput\\\",\\\"data\\\":{\\\"greeting\\\":\\\"Hello $name\\\",\\\"style\\\":\\\"$style\\\"}}\"\n"
    "exit 0\n";

std::string build_manifest() {
  write_file("greet.sh", kGreetBody, 0755);
  write_file("styled.sh", kStyledBody, 0755);
  write_file("plain.sh", "#!/bin/sh\nexit 0\n", 0755);
  write_file("slow.sh", "#!/bin/sh\nsleep 30\n", 0755);
  write_file("fail.sh", "#!/bin/sh\necho 'no luck' >&2\nexit 2\n", 0755);
  const json manifest = {
      {"scripts",
       json::array({
           {{"name", "Greet"},
            {"path", "greet.sh"},
            {"description", "Say hello"},
            {"schema",
             {{"input", {{"name", {{"type", "string"}, {"required", true}}}}},
              {"output", {{"greeting", "string"}}}}}},
           {{"name", "Plain"}, {"path", "plain.sh"}},
           {{"name", "Slow"}, {"path", "slow.sh"}, {"schema", {{"input", {{"x", {{"type", "string"}}}}}}}},
           {{"name", "Fail"}, {"path", "fail.sh"}, {"schema", {{"input", {{"x", {{"type", "string"}}}}}}}},
           {{"name", "Ghost"}, {"path", "ghost.sh"}, {"schema", {{"input", {{"x", {{"type", "string"}}}}}}}},
           {{"name", "Styled Greet"},
            {"path", "styled.sh"},
            {"schema",
             {{"input", json::object({{"name", {{"type", "string"}, {"required", true}}}, {"style", "string"}})},
              {"output", {{"greeting", "string"}, {"style", "string"}}}}}},
       })},
      {"scriptlets", json::array({{{"name", "Open Repo"}, {"group", "Dev"}, {"tool", "bash"}, {"command", "ls"}}})},
  };
  return manifest.dump();
}

bool test_server() {
  std::cout << "\n[mcp_server_test] server\n";
  kitrun::KitConfig config;
  config.kit_path = g_dir;
  config.port = 0;
  config.cancel_grace_ms = 300;
  config.tool_call_timeout_ms = 700;
  kitrun::FinalizeKitConfig(&config);

  kitrun::ScriptCatalog catalog;
  kitrun::KitError err;
  if (!require(kitrun::LoadCatalogManifest(build_manifest(), g_dir, &catalog, &err), "catalog loads")) {
    std::cout << "  error: " << err.message << "\n";
    return false;
  }
  kitrun::ScriptExecutor executor(config);
  kitrun::SlotTable slots;
  kitrun::AuditLogger audit(config.audit_log_path);
  kitrun::McpContext ctx;
  ctx.catalog = &catalog;
  ctx.executor = &executor;
  ctx.slots = &slots;
  ctx.audit = &audit;
  ctx.tool_call_timeout_ms = config.tool_call_timeout_ms;
  kitrun::McpDispatcher dispatcher(ctx);
  kitrun::McpServer server(config, &dispatcher);
  if (!require(server.Start(&err), "server starts")) {
    std::cout << "  error: " << err.message << "\n";
    return false;
  }
  const uint16_t port = server.port();
  const std::string token = server.token();
  require(port != 0, "ephemeral port assigned");
  require(token.size() == 64, "token is 64 hex chars");

  struct stat st;
  require(stat(server.discovery_path().c_str(), &st) == 0 && (st.st_mode & 0777) == 0600, "server.json is 0600");
  const json discovery = json::parse(read_file(server.discovery_path()), nullptr, false);
  require(!discovery.is_discarded() && discovery.value("port", 0) == port && discovery.value("token", "") == token,
          "discovery file carries port and token");
  require(read_file(g_dir + "/agent-token") == token, "token persisted");

  HttpReply reply = http_get(port, "/health", "");
  require(reply.status == 200 && parse_body(reply).value("status", "") == "healthy",
          "health needs no token");
  reply = http_get(port, "/", "");
  require(reply.status == 401 && reply.body == "{\"error\":\"Invalid or missing token\"}", "missing token is 401");
  reply = http_get(port, "/", std::string(64, '0'));
  require(reply.status == 401, "wrong token is 401");
  reply = http_get(port, "/", token);
  require(reply.status == 200 && parse_body(reply).value("name", "") == "script-kit",
          "server info with token");
  reply = http_get(port, "/nowhere", token);
  require(reply.status == 404, "unknown path is 404");

  HttpReply no_length;
  http_raw(port, "POST /rpc HTTP/1.1\r\nHost: x\r\nAuthorization: Bearer " + token + "\r\n\r\n", &no_length);
  require(no_length.status == 400 && error_code(parse_body(no_length)) == -32600,
          "missing Content-Length is 400 with -32600");

  reply = http_post(port, "{not json", token);
  require(reply.status == 200 && error_code(parse_body(reply)) == -32700, "parse error -32700");
  reply = http_post(port, R"({"jsonrpc":"1.0","id":3,"method":"initialize"})", token);
  const json bad_version = parse_body(reply);
  require(error_code(bad_version) == -32600 && bad_version.value("id", 0) == 3, "wrong jsonrpc version -32600");
  reply = http_post(port, R"({"jsonrpc":"2.0","id":4,"params":{}})", token);
  const json no_method = parse_body(reply);
  require(error_code(no_method) == -32600 && no_method.value("id", 0) == 4, "request without method -32600");
  require(error_code(rpc(port, token, "nope/nothing", json::object())) == -32601, "unknown method -32601");

  json r = rpc(port, token, "initialize", {{"clientInfo", {{"name", "test"}}}});
  require(r.contains("result") && r["result"]["serverInfo"].value("name", "") == "script-kit", "initialize");
  require(r.contains("result") && r["result"]["capabilities"]["tools"].value("listChanged", false), "tools capability");

  r = rpc(port, token, "tools/list", json::object());
  std::string names;
  if (r.contains("result")) {
    for (const json &t : r["result"]["tools"]) names += t.value("name", "") + ",";
  }
  require(names == "kit/state,scripts/greet,scripts/slow,scripts/fail,scripts/ghost,scripts/styled-greet,",
          "only schema'd scripts listed");

  r = rpc(port, token, "tools/call", {{"name", "scripts/greet"}, {"arguments", {{"name", "Ada"}}}});
  require(r.contains("result") && !r["result"].value("isError", true), "greet succeeds");
  require(r.contains("result") && r["result"]["structuredContent"].value("greeting", "") == "Hello Ada",
          "structured greeting");
  require(r.contains("result") && !r["result"]["structuredContent"].contains("debug"), "undeclared output dropped");
  require(r.contains("result") && r["result"]["content"][0].value("text", "") == "{\"greeting\":\"Hello Ada\"}",
          "text content is the filtered output");

  r = rpc(port, token, "tools/call", {{"name", "scripts/styled-greet"}, {"arguments", {{"name", "Ada"}}}});
  require(r.contains("result") && !r["result"].value("isError", true), "omitted optional argument is not an error");
  require(r.contains("result") && r["result"]["structuredContent"].value("style", "") == "plain",
          "omitted optional argument answered with null");
  r = rpc(port, token, "tools/call",
          {{"name", "scripts/styled-greet"}, {"arguments", {{"name", "Ada"}, {"style", "bold"}}}});
  require(r.contains("result") && r["result"]["structuredContent"].value("style", "") == "bold",
          "optional argument forwarded when given");

  require(error_code(rpc(port, token, "tools/call", {{"name", "scripts/greet"}, {"arguments", json::object()}})) ==
              -32602,
          "missing required argument -32602");
  require(error_code(rpc(port, token, "tools/call", {{"name", "scripts/greet"}, {"arguments", {{"name", 5}}}})) ==
              -32602,
          "wrong argument type -32602");
  require(error_code(rpc(port, token, "tools/call", {{"name", "scripts/plain"}})) == -32601,
          "script without schema is not a tool");
  require(error_code(rpc(port, token, "tools/call", {{"name", "scripts/slow"}})) == -32001, "slow script times out");
  require(error_code(rpc(port, token, "tools/call", {{"name", "scripts/ghost"}})) == -32002,
          "missing script file is a launch failure");

  r = rpc(port, token, "tools/call", {{"name", "scripts/fail"}});
  require(r.contains("result") && r["result"].value("isError", false), "failing script reports isError");
  require(r.contains("result") && r["result"]["content"][0].value("text", "").find("no luck") != std::string::npos,
          "failure text carries stderr");

  r = rpc(port, token, "tools/call", {{"name", "kit/state"}});
  require(r.contains("result") && r["result"]["structuredContent"].value("scriptCount", 0) == 6, "kit/state tool");

  r = rpc(port, token, "resources/list", json::object());
  require(r.contains("result") && r["result"]["resources"].size() == 3, "three resources");
  r = rpc(port, token, "resources/read", {{"uri", "scriptlets://"}});
  const json scriptlets =
      r.contains("result") ? json::parse(r["result"]["contents"][0].value("text", "null"), nullptr, false) : json();
  require(scriptlets.is_array() && scriptlets.size() == 1 && scriptlets[0].value("name", "") == "Open Repo",
          "scriptlets resource");
  require(error_code(rpc(port, token, "resources/read", {{"uri", "kit://nowhere"}})) == -32601,
          "unknown resource -32601");

  server.Stop();
  require(stat(server.discovery_path().c_str(), &st) != 0, "server.json removed on stop");
  require(http_get(port, "/health", "").status == 0, "no longer listening");

  std::istringstream lines(read_file(config.audit_log_path));
  std::string line;
  int count = 0;
  bool saw_invalid = false;
  bool saw_timeout = false;
  bool saw_greet = false;
  while (std::getline(lines, line)) {
    const json entry = json::parse(line, nullptr, false);
    if (entry.is_discarded()) continue;
    ++count;
    if (entry.value("method", "") == "<invalid>") saw_invalid = true;
    if (entry.value("error_code", 0) == -32001 && entry.value("outcome", "") == "error") saw_timeout = true;
    if (entry.value("tool", "") == "scripts/greet" && entry.value("outcome", "") == "success") saw_greet = true;
  }
  require(count == 19, "every rpc request audited");
  require(saw_invalid, "parse errors audited as <invalid>");
  require(saw_timeout, "timeout audited with its code");
  require(saw_greet, "successful tool call audited");
  require(audit.write_failures() == 0, "no audit write failures");
  return g_fail == 0;
}

}  // namespace

int main() {
  std::cout << "[mcp_server_test] starting\n";
  char tmpl[] = "/tmp/kitrun_mcp_XXXXXX";
  if (!mkdtemp(tmpl)) {
    std::cout << "[mcp_server_test] FAIL: mkdtemp\n";
    return 1;
  }
  g_dir = tmpl;

  test_server();

  std::cout << "\n[mcp_server_test] " << g_pass << " passed, " << g_fail << " failed\n";
  if (g_fail == 0) {
    std::cout << "[mcp_server_test] PASS\n";
    return 0;
  }
  std::cout << "[mcp_server_test] FAIL\n";
  return 1;
}

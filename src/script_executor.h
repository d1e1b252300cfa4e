#ifndef KITRUN_SCRIPT_EXECUTOR_H_
#define KITRUN_SCRIPT_EXECUTOR_H_

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "kit_config.h"
#include "kit_protocol.h"
#include "protocol_codec.h"

namespace kitrun {

using SessionId = uint64_t;

enum class ExecutorEventKind : uint8_t {
  Message = 0,
  SessionEnded = 1,
};

struct SessionEndInfo {
  int exit_code = -1;   // -1 when the process did not exit normally
  int term_signal = 0;  // non-zero when killed by a signal
  std::string reason;
  std::string stderr_tail;
};

struct ExecutorEvent {
  SessionId session = 0;
  ExecutorEventKind kind = ExecutorEventKind::Message;
  ProtocolMessage message;
  SessionEndInfo ended;
};

struct LaunchRequest {
  std::string script_path;
  std::vector<std::string> args;
  // Applied after the inherited whitelist; later entries win.
  std::vector<std::pair<std::string, std::string>> env;
  // Optional interpreter override (absolute path or a name found on PATH).
  std::string interpreter;
};

struct SessionInfo {
  SessionId id = 0;
  int pid = -1;
  std::string script_path;
  bool alive = false;
  int malformed_count = 0;
  int violation_count = 0;
  std::string pending_prompt_id;
};

// Locates an executable by name in the usual user install directories and
// then $PATH. Returns an empty string when nothing executable is found.
std::string FindExecutable(const std::string &name);

// Builds argv for a script: .ts -> bun run [--preload sdk], .js -> node,
// .sh -> /bin/sh, anything else is executed directly.
bool ResolveInterpreter(const LaunchRequest &request, const std::string &sdk_preload,
                        std::vector<std::string> *argv, KitError *error);

// Inherited variables (PATH HOME TMPDIR USER LANG TERM SHELL XDG_RUNTIME_DIR
// and SCRIPT_KIT*) followed by the request's overrides, as KEY=VALUE.
std::vector<std::string> BuildChildEnvironment(const std::vector<std::pair<std::string, std::string>> &overrides);

// Owns every running script process. Each session gets a stdout reader, a
// stdin writer, a stderr reader and an exit waiter thread; the caller only
// touches the session's event channel through PollEvent/WaitEvent.
class ScriptExecutor {
 public:
  explicit ScriptExecutor(const KitConfig &config);
  ~ScriptExecutor();

  ScriptExecutor(const ScriptExecutor &) = delete;
  ScriptExecutor &operator=(const ScriptExecutor &) = delete;

  bool Launch(const LaunchRequest &request, SessionId *out, KitError *error);
  bool SendResponse(SessionId id, const nlohmann::json &value, KitError *error);
  bool SendHelloAck(SessionId id, KitError *error);
  bool Cancel(SessionId id, KitError *error);
  // Answers the pending prompt with the null sentinel but leaves the script
  // running: no SIGTERM, no grace timer.
  bool Dismiss(SessionId id, KitError *error);
  bool PollEvent(SessionId id, ExecutorEvent *out);
  bool WaitEvent(SessionId id, int timeout_ms, ExecutorEvent *out);
  void Release(SessionId id);

  int MalformedCount(SessionId id) const;
  int GlobalMalformedCount() const { return global_malformed_.load(); }
  std::vector<SessionInfo> ListSessions() const;
  const KitConfig &config() const { return config_; }

 private:
  struct Session;

  std::shared_ptr<Session> Find(SessionId id) const;
  bool Enqueue(const std::shared_ptr<Session> &session, const HostResponse &response, KitError *error);
  bool RecordMalformed(const std::shared_ptr<Session> &session, const std::string &why);
  void ReaderLoop(std::shared_ptr<Session> session);
  void WriterLoop(std::shared_ptr<Session> session);
  void StderrLoop(std::shared_ptr<Session> session);
  void WaiterLoop(std::shared_ptr<Session> session);
  void GraceLoop(std::shared_ptr<Session> session);

  KitConfig config_;
  std::string sdk_preload_;
  mutable std::mutex registry_mu_;
  std::unordered_map<SessionId, std::shared_ptr<Session>> sessions_;
  std::atomic<uint64_t> next_id_;
  std::atomic<int> global_malformed_;
};

}  // namespace kitrun

#endif  // KITRUN_SCRIPT_EXECUTOR_H_

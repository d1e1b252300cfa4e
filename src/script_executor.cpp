#include "script_executor.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <string>
#include <thread>
#include <vector>

#include "channel.h"
#include "log.h"

extern char **environ;

namespace kitrun {

namespace {

// How long output may keep flowing after the script itself has exited.
constexpr int kExitDrainMs = 250;
constexpr int kReadPollMs = 50;

const char *const kInheritedEnv[] = {
    "PATH", "HOME", "TMPDIR", "USER", "LANG", "TERM", "SHELL", "XDG_RUNTIME_DIR",
};

bool write_all(int fd, const void *buf, size_t len) {
  const uint8_t *p = (const uint8_t *)buf;
  size_t off = 0;
  while (off < len) {
    const ssize_t n = write(fd, p + off, len - off);
    if (n <= 0) {
      if (n < 0 && errno == EINTR) continue;
      return false;
    }
    off += (size_t)n;
  }
  return true;
}

// Atomic CLOEXEC: a concurrent Launch must never inherit another session's pipes.
bool make_pipe(int fds[2]) { return pipe2(fds, O_CLOEXEC) == 0; }

void close_fd(int *fd) {
  if (*fd >= 0) {
    close(*fd);
    *fd = -1;
  }
}

bool is_executable_file(const std::string &path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string lower_extension(const std::string &path) {
  const size_t slash = path.find_last_of('/');
  const size_t dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
  std::string ext = path.substr(dot + 1);
  for (char &c : ext) c = (char)std::tolower((unsigned char)c);
  return ext;
}

enum class LineStatus : uint8_t {
  Line = 0,
  TooLong = 1,
  Eof = 2,
};

// Newline splitter over a pipe. Lines longer than `max_bytes` are discarded
// up to their terminating newline and reported once as TooLong. Once
// `abandon` is set, an idle pipe is treated as end of stream even if a
// leftover process still holds the write end.
class LineReader {
 public:
  LineReader(int fd, size_t max_bytes, const std::atomic<bool> *abandon)
      : fd_(fd), max_(max_bytes), abandon_(abandon), scan_(0), eof_(false), discarding_(false) {}

  LineStatus Next(std::string *line) {
    while (true) {
      const size_t nl = buf_.find('\n', scan_);
      if (nl != std::string::npos) {
        line->assign(buf_, 0, nl);
        buf_.erase(0, nl + 1);
        scan_ = 0;
        if (discarding_ || line->size() > max_) {
          discarding_ = false;
          line->clear();
          return LineStatus::TooLong;
        }
        if (!line->empty() && line->back() == '\r') line->pop_back();
        return LineStatus::Line;
      }
      scan_ = buf_.size();
      if (buf_.size() > max_) {
        discarding_ = true;
        buf_.clear();
        scan_ = 0;
      }
      if (eof_) {
        if (discarding_) {
          discarding_ = false;
          return LineStatus::TooLong;
        }
        if (!buf_.empty()) {
          line->swap(buf_);
          buf_.clear();
          scan_ = 0;
          return LineStatus::Line;
        }
        return LineStatus::Eof;
      }
      struct pollfd pfd = {fd_, POLLIN, 0};
      const int ready = poll(&pfd, 1, kReadPollMs);
      if (ready < 0 && errno == EINTR) continue;
      if (ready == 0) {
        if (abandon_->load()) eof_ = true;
        continue;
      }
      char tmp[4096];
      const ssize_t n = read(fd_, tmp, sizeof(tmp));
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) {
        eof_ = true;
        continue;
      }
      buf_.append(tmp, (size_t)n);
    }
  }

 private:
  int fd_;
  size_t max_;
  const std::atomic<bool> *abandon_;
  std::string buf_;
  size_t scan_;
  bool eof_;
  bool discarding_;
};

}  // namespace

struct ScriptExecutor::Session {
  SessionId id = 0;
  pid_t pid = -1;
  std::string script_path;
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;

  Channel<ExecutorEvent> events;
  Channel<std::string> outbound;
  std::thread reader;
  std::thread writer;
  std::thread stderr_reader;
  std::thread waiter;
  std::thread grace;
  std::atomic<bool> abandon_pipes{false};

  std::atomic<int> malformed{0};
  std::atomic<int> violations{0};

  // Guards everything below. Never held across pipe I/O.
  std::mutex mu;
  std::condition_variable cv;
  bool exited = false;  // leader is a zombie; its pid stays reserved until reaped
  bool reaped = false;
  bool closed = false;
  bool stdout_done = false;
  bool stderr_done = false;
  bool grace_armed = false;
  bool releasing = false;
  bool prompt_pending = false;
  std::string pending_prompt_id;
  std::deque<std::string> stderr_tail;
  std::string kill_reason;
};

namespace {

// Caller holds session->mu. The waiter reaps under the same lock, so a
// false `reaped` means the group id still belongs to this session.
template <typename SessionT>
void signal_group_locked(SessionT *s, int sig) {
  if (s->reaped || s->pid <= 0) return;
  ::kill(-s->pid, sig);
}

}  // namespace

std::string FindExecutable(const std::string &name) {
  if (name.empty()) return "";
  if (name.find('/') != std::string::npos) return is_executable_file(name) ? name : "";

  std::vector<std::string> dirs;
  const char *home = std::getenv("HOME");
  if (home && home[0] != '\0') {
    dirs.push_back(std::string(home) + "/.bun/bin");
    dirs.push_back(std::string(home) + "/.local/bin");
  }
  dirs.push_back("/opt/homebrew/bin");
  dirs.push_back("/usr/local/bin");
  dirs.push_back("/usr/bin");
  dirs.push_back("/bin");
  const char *path = std::getenv("PATH");
  if (path) {
    std::string entry;
    for (const char *p = path;; ++p) {
      if (*p == ':' || *p == '\0') {
        if (!entry.empty()) dirs.push_back(entry);
        entry.clear();
        if (*p == '\0') break;
      } else {
        entry.push_back(*p);
      }
    }
  }
  for (const std::string &dir : dirs) {
    const std::string candidate = dir + "/" + name;
    if (is_executable_file(candidate)) return candidate;
  }
  return "";
}

bool ResolveInterpreter(const LaunchRequest &request, const std::string &sdk_preload,
                        std::vector<std::string> *argv, KitError *error) {
  argv->clear();
  const std::string &path = request.script_path;
  if (!request.interpreter.empty()) {
    const std::string interp = FindExecutable(request.interpreter);
    if (interp.empty()) return set_err(error, KitErrorCode::LaunchError, "Interpreter not found: " + request.interpreter);
    argv->push_back(interp);
    argv->push_back(path);
  } else {
    const std::string ext = lower_extension(path);
    if (ext == "ts" || ext == "tsx" || ext == "mts") {
      const std::string bun = FindExecutable("bun");
      if (bun.empty()) return set_err(error, KitErrorCode::LaunchError, "Interpreter not found: bun");
      argv->push_back(bun);
      argv->push_back("run");
      if (!sdk_preload.empty()) {
        argv->push_back("--preload");
        argv->push_back(sdk_preload);
      }
      argv->push_back(path);
    } else if (ext == "js" || ext == "mjs" || ext == "cjs") {
      const std::string node = FindExecutable("node");
      if (node.empty()) return set_err(error, KitErrorCode::LaunchError, "Interpreter not found: node");
      argv->push_back(node);
      argv->push_back(path);
    } else if (ext == "sh") {
      const std::string sh = FindExecutable("sh");
      if (sh.empty()) return set_err(error, KitErrorCode::LaunchError, "Interpreter not found: sh");
      argv->push_back(sh);
      argv->push_back(path);
    } else {
      if (access(path.c_str(), X_OK) != 0) {
        return set_err(error, KitErrorCode::LaunchError, "Script is not executable: " + path);
      }
      argv->push_back(path);
    }
  }
  for (const std::string &a : request.args) argv->push_back(a);
  return true;
}

std::vector<std::string> BuildChildEnvironment(const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::vector<std::string> out;
  for (char **e = environ; e && *e; ++e) {
    const std::string entry = *e;
    const size_t eq = entry.find('=');
    if (eq == std::string::npos) continue;
    const std::string key = entry.substr(0, eq);
    bool keep = key.compare(0, 10, "SCRIPT_KIT") == 0;
    for (const char *name : kInheritedEnv) {
      if (key == name) keep = true;
    }
    if (keep) out.push_back(entry);
  }
  for (const auto &kv : overrides) {
    const std::string prefix = kv.first + "=";
    out.erase(std::remove_if(out.begin(), out.end(),
                             [&](const std::string &e) { return e.compare(0, prefix.size(), prefix) == 0; }),
              out.end());
    out.push_back(prefix + kv.second);
  }
  return out;
}

ScriptExecutor::ScriptExecutor(const KitConfig &config)
    : config_(config), next_id_(1), global_malformed_(0) {
  if (!config_.kit_path.empty()) {
    const std::string sdk = config_.kit_path + "/sdk/kit-sdk.ts";
    struct stat st;
    if (stat(sdk.c_str(), &st) == 0) sdk_preload_ = sdk;
  }
}

ScriptExecutor::~ScriptExecutor() {
  std::vector<SessionId> ids;
  {
    std::lock_guard<std::mutex> lock(registry_mu_);
    for (const auto &kv : sessions_) ids.push_back(kv.first);
  }
  for (SessionId id : ids) Release(id);
}

std::shared_ptr<ScriptExecutor::Session> ScriptExecutor::Find(SessionId id) const {
  std::lock_guard<std::mutex> lock(registry_mu_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) return nullptr;
  return it->second;
}

bool ScriptExecutor::Launch(const LaunchRequest &request, SessionId *out, KitError *error) {
  static std::once_flag sigpipe_once;
  std::call_once(sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });

  if (request.script_path.empty()) return set_err(error, KitErrorCode::LaunchError, "No script path given.");
  struct stat st;
  if (stat(request.script_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return set_err(error, KitErrorCode::LaunchError, "Script not found: " + request.script_path);
  }

  std::vector<std::string> argv;
  if (!ResolveInterpreter(request, sdk_preload_, &argv, error)) return false;
  const std::vector<std::string> envs = BuildChildEnvironment(request.env);

  // Everything the child touches is built before fork.
  std::vector<char *> cargv;
  for (const std::string &a : argv) cargv.push_back(const_cast<char *>(a.c_str()));
  cargv.push_back(nullptr);
  std::vector<char *> cenv;
  for (const std::string &e : envs) cenv.push_back(const_cast<char *>(e.c_str()));
  cenv.push_back(nullptr);

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int *fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                    &status_pipe[0], &status_pipe[1]}) {
      close_fd(fd);
    }
  };
  if (!make_pipe(in_pipe) || !make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(status_pipe)) {
    const int e = errno;
    close_all();
    return set_err(error, KitErrorCode::LaunchError, std::string("pipe failed: ") + std::strerror(e));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int e = errno;
    close_all();
    return set_err(error, KitErrorCode::LaunchError, std::string("fork failed: ") + std::strerror(e));
  }
  if (pid == 0) {
    setpgid(0, 0);
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    signal(SIGPIPE, SIG_DFL);
    execve(cargv[0], cargv.data(), cenv.data());
    const int e = errno;
    ssize_t ignored = write(status_pipe[1], &e, sizeof(e));
    (void)ignored;
    _exit(127);
  }

  setpgid(pid, pid);
  close_fd(&in_pipe[0]);
  close_fd(&out_pipe[1]);
  close_fd(&err_pipe[1]);
  close_fd(&status_pipe[1]);

  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(&status_pipe[0]);
  if (n == (ssize_t)sizeof(exec_errno)) {
    close_all();
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    log_event("SESSION_EXEC_FAILED", 0, argv[0] + ": " + std::strerror(exec_errno));
    return set_err(error, KitErrorCode::LaunchError,
                   "exec " + argv[0] + " failed: " + std::strerror(exec_errno));
  }

  auto session = std::make_shared<Session>();
  session->id = next_id_.fetch_add(1);
  session->pid = pid;
  session->script_path = request.script_path;
  session->stdin_fd = in_pipe[1];
  session->stdout_fd = out_pipe[0];
  session->stderr_fd = err_pipe[0];

  {
    std::lock_guard<std::mutex> lock(registry_mu_);
    sessions_[session->id] = session;
  }
  log_event("SESSION_SPAWNED", session->id, "pid=" + std::to_string(pid) + " script=" + request.script_path);

  session->writer = std::thread(&ScriptExecutor::WriterLoop, this, session);
  session->stderr_reader = std::thread(&ScriptExecutor::StderrLoop, this, session);
  session->reader = std::thread(&ScriptExecutor::ReaderLoop, this, session);
  session->waiter = std::thread(&ScriptExecutor::WaiterLoop, this, session);
  if (out) *out = session->id;
  return true;
}

bool ScriptExecutor::RecordMalformed(const std::shared_ptr<Session> &s, const std::string &why) {
  const int session_count = s->malformed.fetch_add(1) + 1;
  const int global_count = global_malformed_.fetch_add(1) + 1;
  log_event("PROTOCOL_MALFORMED", s->id, why);
  const int count = config_.malformed_budget_scope == MalformedBudgetScope::Global ? global_count : session_count;
  if (count <= config_.malformed_budget) return false;
  log_event("MALFORMED_BUDGET_EXCEEDED", s->id,
            std::string("scope=") + MalformedBudgetScopeName(config_.malformed_budget_scope) +
                " count=" + std::to_string(count));
  std::lock_guard<std::mutex> lock(s->mu);
  if (s->kill_reason.empty()) s->kill_reason = "malformed message budget exceeded";
  s->closed = true;
  signal_group_locked(s.get(), SIGKILL);
  return true;
}

void ScriptExecutor::ReaderLoop(std::shared_ptr<Session> s) {
  LineReader lines(s->stdout_fd, config_.max_line_bytes, &s->abandon_pipes);
  std::string line;
  while (true) {
    const LineStatus st = lines.Next(&line);
    if (st == LineStatus::Eof) break;
    if (st == LineStatus::TooLong) {
      RecordMalformed(s, "line exceeds " + std::to_string(config_.max_line_bytes) + " bytes");
      continue;
    }
    if (line.empty()) continue;

    ProtocolMessage msg;
    KitError err;
    const DecodeStatus ds = DecodeMessage(line, config_.max_line_bytes, &msg, &err);
    if (ds == DecodeStatus::UnknownType) {
      log_event("PROTOCOL_UNKNOWN_TYPE", s->id, summarize_payload(line));
      continue;
    }
    if (ds == DecodeStatus::Malformed) {
      RecordMalformed(s, err.message + " " + summarize_payload(line));
      continue;
    }
    if (MessageKindNeedsResponse(msg.kind)) {
      std::lock_guard<std::mutex> lock(s->mu);
      if (s->prompt_pending) {
        s->violations.fetch_add(1);
        log_event("PROTOCOL_VIOLATION", s->id,
                  "prompt " + msg.prompt.id + " while " + s->pending_prompt_id + " is unanswered");
        continue;
      }
      s->prompt_pending = true;
      s->pending_prompt_id = msg.prompt.id;
    }
    log_event("MESSAGE_RECEIVED", s->id, summarize_payload(line));
    ExecutorEvent ev;
    ev.session = s->id;
    ev.kind = ExecutorEventKind::Message;
    ev.message = std::move(msg);
    s->events.Push(std::move(ev));
  }
  close_fd(&s->stdout_fd);
  std::lock_guard<std::mutex> lock(s->mu);
  s->stdout_done = true;
  s->cv.notify_all();
}

// Waits for the script itself rather than for its pipes: a background child
// may keep stdout open long after the script exits.
void ScriptExecutor::WaiterLoop(std::shared_ptr<Session> s) {
  siginfo_t exit_info;
  int w = -1;
  do {
    std::memset(&exit_info, 0, sizeof(exit_info));
    w = waitid(P_PID, (id_t)s->pid, &exit_info, WEXITED | WNOWAIT);
  } while (w < 0 && errno == EINTR);
  const int wait_errno = w < 0 ? errno : 0;

  SessionEndInfo info;
  {
    std::unique_lock<std::mutex> lock(s->mu);
    s->exited = true;
    s->closed = true;
    s->prompt_pending = false;
    s->cv.notify_all();
    const bool drained = s->cv.wait_for(lock, std::chrono::milliseconds(kExitDrainMs),
                                        [&] { return s->stdout_done && s->stderr_done; });
    if (!drained) {
      log_event("SESSION_PIPES_HELD", s->id, "killing leftover process group");
      signal_group_locked(s.get(), SIGKILL);
    }
    s->abandon_pipes.store(true);
    // The readers see the abandon flag within one poll interval.
    s->cv.wait(lock, [&] { return s->stdout_done && s->stderr_done; });

    int status = 0;
    pid_t r = -1;
    if (wait_errno == 0) {
      do {
        r = waitpid(s->pid, &status, 0);
      } while (r < 0 && errno == EINTR);
    }
    const int reap_errno = r < 0 ? (wait_errno ? wait_errno : errno) : 0;
    s->reaped = true;

    for (const std::string &l : s->stderr_tail) {
      if (!info.stderr_tail.empty()) info.stderr_tail.push_back('\n');
      info.stderr_tail += l;
    }
    std::string base;
    if (r < 0) {
      base = std::string("waitpid failed: ") + std::strerror(reap_errno);
    } else if (WIFEXITED(status)) {
      info.exit_code = WEXITSTATUS(status);
      base = "exited with code " + std::to_string(info.exit_code);
    } else if (WIFSIGNALED(status)) {
      info.term_signal = WTERMSIG(status);
      base = "killed by signal " + std::to_string(info.term_signal);
    } else {
      base = "ended";
    }
    info.reason = s->kill_reason.empty() ? base : s->kill_reason + " (" + base + ")";
    s->cv.notify_all();
  }
  s->outbound.Close();

  log_event("SESSION_ENDED", s->id, info.reason);
  ExecutorEvent ev;
  ev.session = s->id;
  ev.kind = ExecutorEventKind::SessionEnded;
  ev.ended = info;
  s->events.Push(std::move(ev));
  s->events.Close();
}

void ScriptExecutor::WriterLoop(std::shared_ptr<Session> s) {
  std::string line;
  while (s->outbound.Pop(&line)) {
    if (!write_all(s->stdin_fd, line.data(), line.size())) {
      const int e = errno;
      log_event("WRITE_FAILED", s->id, std::strerror(e));
      {
        std::lock_guard<std::mutex> lock(s->mu);
        s->closed = true;
        if (!s->exited && s->kill_reason.empty()) s->kill_reason = "stdin write failed";
        signal_group_locked(s.get(), SIGKILL);
      }
      s->outbound.Close();
      break;
    }
    log_event("MESSAGE_SENT", s->id, summarize_payload(line));
  }
  close_fd(&s->stdin_fd);
}

void ScriptExecutor::StderrLoop(std::shared_ptr<Session> s) {
  LineReader lines(s->stderr_fd, config_.max_line_bytes, &s->abandon_pipes);
  std::string line;
  while (true) {
    const LineStatus st = lines.Next(&line);
    if (st == LineStatus::Eof) break;
    if (st == LineStatus::TooLong) line = "<stderr line too long>";
    log_event("SCRIPT_STDERR", s->id, line);
    std::lock_guard<std::mutex> lock(s->mu);
    s->stderr_tail.push_back(line);
    while (s->stderr_tail.size() > config_.stderr_tail_lines) s->stderr_tail.pop_front();
  }
  close_fd(&s->stderr_fd);
  std::lock_guard<std::mutex> lock(s->mu);
  s->stderr_done = true;
  s->cv.notify_all();
}

void ScriptExecutor::GraceLoop(std::shared_ptr<Session> s) {
  std::unique_lock<std::mutex> lock(s->mu);
  const bool ended = s->cv.wait_for(lock, std::chrono::milliseconds(config_.cancel_grace_ms),
                                    [&] { return s->exited || s->releasing; });
  if (ended) return;
  s->kill_reason = "cancel grace period expired";
  log_event("SESSION_FORCE_KILLED", s->id, "grace_ms=" + std::to_string(config_.cancel_grace_ms));
  signal_group_locked(s.get(), SIGKILL);
}

bool ScriptExecutor::Enqueue(const std::shared_ptr<Session> &s, const HostResponse &response, KitError *error) {
  std::string line;
  if (!EncodeResponse(response, &line, error)) return false;
  if (!s->outbound.Push(line)) {
    return set_err(error, KitErrorCode::SessionClosed, "Session " + std::to_string(s->id) + " is closed.");
  }
  return true;
}

bool ScriptExecutor::SendResponse(SessionId id, const nlohmann::json &value, KitError *error) {
  std::shared_ptr<Session> s = Find(id);
  if (!s) return set_err(error, KitErrorCode::SessionClosed, "Unknown session " + std::to_string(id) + ".");
  if (value.is_null()) {
    return set_err(error, KitErrorCode::InvalidArgument, "null is reserved for cancellation");
  }
  std::lock_guard<std::mutex> lock(s->mu);
  if (s->closed) return set_err(error, KitErrorCode::SessionClosed, "Session " + std::to_string(id) + " has exited.");
  if (!s->prompt_pending) {
    return set_err(error, KitErrorCode::ProtocolError, "No prompt is awaiting a response.");
  }
  if (!Enqueue(s, MakeAnswer(s->pending_prompt_id, value), error)) return false;
  s->prompt_pending = false;
  return true;
}

bool ScriptExecutor::Dismiss(SessionId id, KitError *error) {
  std::shared_ptr<Session> s = Find(id);
  if (!s) return set_err(error, KitErrorCode::SessionClosed, "Unknown session " + std::to_string(id) + ".");
  std::lock_guard<std::mutex> lock(s->mu);
  if (s->closed) return set_err(error, KitErrorCode::SessionClosed, "Session " + std::to_string(id) + " has exited.");
  if (!s->prompt_pending) {
    return set_err(error, KitErrorCode::ProtocolError, "No prompt is awaiting a response.");
  }
  if (!Enqueue(s, MakeCancel(s->pending_prompt_id), error)) return false;
  s->prompt_pending = false;
  log_event("PROMPT_DISMISSED", s->id, s->pending_prompt_id);
  return true;
}

bool ScriptExecutor::SendHelloAck(SessionId id, KitError *error) {
  std::shared_ptr<Session> s = Find(id);
  if (!s) return set_err(error, KitErrorCode::SessionClosed, "Unknown session " + std::to_string(id) + ".");
  std::lock_guard<std::mutex> lock(s->mu);
  if (s->closed) return set_err(error, KitErrorCode::SessionClosed, "Session " + std::to_string(id) + " has exited.");
  return Enqueue(s, MakeHelloAck({"submitJson"}), error);
}

bool ScriptExecutor::Cancel(SessionId id, KitError *error) {
  std::shared_ptr<Session> s = Find(id);
  if (!s) return set_err(error, KitErrorCode::SessionClosed, "Unknown session " + std::to_string(id) + ".");
  std::lock_guard<std::mutex> lock(s->mu);
  if (s->exited) return set_err(error, KitErrorCode::SessionClosed, "Session " + std::to_string(id) + " has exited.");
  if (s->kill_reason.empty()) s->kill_reason = "cancelled";
  if (s->prompt_pending && !s->closed) {
    KitError enqueue_err;
    if (Enqueue(s, MakeCancel(s->pending_prompt_id), &enqueue_err)) {
      s->prompt_pending = false;
      log_event("SESSION_CANCEL", s->id, "sentinel");
    } else {
      signal_group_locked(s.get(), SIGTERM);
    }
  } else {
    // Nothing is waiting on stdin, so the sentinel would go unread.
    signal_group_locked(s.get(), SIGTERM);
    log_event("SESSION_CANCEL", s->id, "sigterm");
  }
  if (!s->grace_armed) {
    s->grace_armed = true;
    s->grace = std::thread(&ScriptExecutor::GraceLoop, this, s);
  }
  return true;
}

bool ScriptExecutor::PollEvent(SessionId id, ExecutorEvent *out) {
  std::shared_ptr<Session> s = Find(id);
  if (!s) return false;
  return s->events.TryPop(out);
}

bool ScriptExecutor::WaitEvent(SessionId id, int timeout_ms, ExecutorEvent *out) {
  std::shared_ptr<Session> s = Find(id);
  if (!s) return false;
  return s->events.PopWait(out, timeout_ms);
}

void ScriptExecutor::Release(SessionId id) {
  std::shared_ptr<Session> s;
  {
    std::lock_guard<std::mutex> lock(registry_mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return;
    s = it->second;
    sessions_.erase(it);
  }
  {
    std::lock_guard<std::mutex> lock(s->mu);
    s->releasing = true;
    s->closed = true;
    if (!s->exited) {
      if (s->kill_reason.empty()) s->kill_reason = "released";
      signal_group_locked(s.get(), SIGKILL);
    }
    s->cv.notify_all();
  }
  s->outbound.Close();
  if (s->waiter.joinable()) s->waiter.join();
  if (s->reader.joinable()) s->reader.join();
  if (s->writer.joinable()) s->writer.join();
  if (s->stderr_reader.joinable()) s->stderr_reader.join();
  if (s->grace.joinable()) s->grace.join();
  s->events.Close();
  log_event("SESSION_RELEASED", id);
}

int ScriptExecutor::MalformedCount(SessionId id) const {
  std::shared_ptr<Session> s = Find(id);
  return s ? s->malformed.load() : 0;
}

std::vector<SessionInfo> ScriptExecutor::ListSessions() const {
  std::vector<std::shared_ptr<Session>> snapshot;
  {
    std::lock_guard<std::mutex> lock(registry_mu_);
    for (const auto &kv : sessions_) snapshot.push_back(kv.second);
  }
  std::vector<SessionInfo> out;
  for (const auto &s : snapshot) {
    SessionInfo info;
    info.id = s->id;
    info.pid = (int)s->pid;
    info.script_path = s->script_path;
    info.malformed_count = s->malformed.load();
    info.violation_count = s->violations.load();
    {
      std::lock_guard<std::mutex> lock(s->mu);
      info.alive = !s->exited;
      if (s->prompt_pending) info.pending_prompt_id = s->pending_prompt_id;
    }
    out.push_back(std::move(info));
  }
  std::sort(out.begin(), out.end(), [](const SessionInfo &a, const SessionInfo &b) { return a.id < b.id; });
  return out;
}

}  // namespace kitrun

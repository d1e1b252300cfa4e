#ifndef KITRUN_LOG_H_
#define KITRUN_LOG_H_

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

// Emits a single newline-delimited JSON log record to stderr.
//
// Format:
//   {"src":"kitrun","event":"<event>","session_id":<id>}
//   {"src":"kitrun","event":"<event>","session_id":<id>,"details":"<escaped>"}
//
// The details string is JSON-escaped: backslashes, quotes, and control
// characters are all safely encoded so the output is always valid JSON.
// Records from concurrent reader/writer threads never interleave.
//
// Query logs with:
//   ./kitd 2>kitd.log
//   grep '"event":"SESSION_ENDED"' kitd.log | jq .
//
// Usage:
//   kitrun::log_event("SESSION_SPAWNED", id);
//   kitrun::log_event("SESSION_SPAWNED", id, "pid=4242");
//   kitrun::log_event("SCRIPT_STDERR", id, line);  // multiline strings are safe

namespace kitrun {

inline std::mutex &log_mutex() {
  static std::mutex mu;
  return mu;
}

inline void log_event(const char *event, uint64_t session_id, const char *details = nullptr) {
  std::lock_guard<std::mutex> lock(log_mutex());
  if (details && details[0] != '\0') {
    std::fprintf(stderr, "{\"src\":\"kitrun\",\"event\":\"%s\",\"session_id\":%llu,\"details\":\"",
                 event, (unsigned long long)session_id);
    for (const char *p = details; *p != '\0'; ++p) {
      const unsigned char c = (unsigned char)*p;
      if      (c == '"')  std::fputs("\\\"", stderr);
      else if (c == '\\') std::fputs("\\\\", stderr);
      else if (c == '\n') std::fputs("\\n",  stderr);
      else if (c == '\r') std::fputs("\\r",  stderr);
      else if (c == '\t') std::fputs("\\t",  stderr);
      else if (c < 0x20)  std::fprintf(stderr, "\\u%04x", c);
      else                std::fputc(c, stderr);
    }
    std::fputs("\"}\n", stderr);
  } else {
    std::fprintf(stderr, "{\"src\":\"kitrun\",\"event\":\"%s\",\"session_id\":%llu}\n",
                 event, (unsigned long long)session_id);
  }
}

inline void log_event(const char *event, uint64_t session_id, const std::string &details) {
  log_event(event, session_id, details.c_str());
}

// Short description of a protocol line for logs: type and length only.
//   {"type":"arg","id":"1",...}  ->  {type:arg, len:57}
inline std::string summarize_payload(const std::string &json) {
  const std::string key = "\"type\":\"";
  const size_t pos = json.find(key);
  if (pos != std::string::npos) {
    const size_t start = pos + key.size();
    const size_t end = json.find('"', start);
    if (end != std::string::npos) {
      return "{type:" + json.substr(start, end - start) + ", len:" + std::to_string(json.size()) + "}";
    }
  }
  return "{len:" + std::to_string(json.size()) + "}";
}

}  // namespace kitrun

#endif  // KITRUN_LOG_H_

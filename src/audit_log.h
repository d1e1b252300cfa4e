#ifndef KITRUN_AUDIT_LOG_H_
#define KITRUN_AUDIT_LOG_H_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "kit_protocol.h"

namespace kitrun {

struct AuditLogEntry {
  std::string timestamp;
  std::string method;
  std::string tool;
  std::string params_digest;
  int64_t duration_ms = 0;
  bool success = true;
  int error_code = 0;
  std::string reason;
};

// 2024-12-25T10:30:45.123Z
std::string FormatRfc3339Millis(std::chrono::system_clock::time_point when);

// Replaces values under secret-looking keys (token, password, secret, key,
// authorization) with "[REDACTED]", recursively.
nlohmann::json RedactParams(const nlohmann::json &params);

// Redacted compact JSON, cut to `max_bytes` with a trailing "..." when longer.
std::string DigestParams(const nlohmann::json &params, size_t max_bytes = kAuditDigestMaxBytes);

std::string AuditEntryToJsonLine(const AuditLogEntry &entry);

// Append-only JSONL sink. Append never reports failure to the caller.
class AuditLogger {
 public:
  explicit AuditLogger(std::string path);

  AuditLogger(const AuditLogger &) = delete;
  AuditLogger &operator=(const AuditLogger &) = delete;

  void Append(const AuditLogEntry &entry);
  const std::string &path() const { return path_; }
  uint64_t write_failures() const { return write_failures_.load(); }

 private:
  std::mutex mu_;
  std::string path_;
  bool dir_ready_;
  std::atomic<uint64_t> write_failures_;
};

}  // namespace kitrun

#endif  // KITRUN_AUDIT_LOG_H_

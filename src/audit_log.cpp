#include "audit_log.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <utility>

#include "log.h"

namespace kitrun {

namespace {

using json = nlohmann::json;

bool is_secret_key(const std::string &key) {
  std::string k;
  for (const char c : key) k.push_back((char)std::tolower((unsigned char)c));
  if (k.find("token") != std::string::npos) return true;
  if (k.find("password") != std::string::npos) return true;
  if (k.find("secret") != std::string::npos) return true;
  if (k.find("authorization") != std::string::npos) return true;
  return k.size() >= 3 && k.compare(k.size() - 3, 3, "key") == 0;
}

bool make_dirs(const std::string &dir) {
  if (dir.empty()) return true;
  std::string partial;
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = dir.find('/', pos + 1);
    partial = dir.substr(0, pos);
    if (partial.empty()) continue;
    if (mkdir(partial.c_str(), 0700) != 0 && errno != EEXIST) return false;
  }
  return true;
}

bool write_all(int fd, const std::string &data) {
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = write(fd, data.data() + off, data.size() - off);
    if (n <= 0) {
      if (n < 0 && errno == EINTR) continue;
      return false;
    }
    off += (size_t)n;
  }
  return true;
}

}  // namespace

std::string FormatRfc3339Millis(std::chrono::system_clock::time_point when) {
  const auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
  const std::time_t secs = (std::time_t)(ms_total / 1000);
  const int ms = (int)(ms_total % 1000);
  std::tm tmv = {};
  gmtime_r(&secs, &tmv);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tmv.tm_year + 1900,
                tmv.tm_mon + 1,
                tmv.tm_mday,
                tmv.tm_hour,
                tmv.tm_min,
                tmv.tm_sec,
                ms);
  return std::string(buf);
}

json RedactParams(const json &params) {
  if (params.is_object()) {
    json out = json::object();
    for (auto it = params.begin(); it != params.end(); ++it) {
      out[it.key()] = is_secret_key(it.key()) ? json("[REDACTED]") : RedactParams(it.value());
    }
    return out;
  }
  if (params.is_array()) {
    json out = json::array();
    for (const json &v : params) out.push_back(RedactParams(v));
    return out;
  }
  return params;
}

std::string DigestParams(const json &params, size_t max_bytes) {
  std::string digest = RedactParams(params).dump(-1, ' ', false, json::error_handler_t::replace);
  if (digest.size() <= max_bytes) return digest;
  size_t cut = max_bytes;
  // Do not split a UTF-8 sequence.
  while (cut > 0 && ((unsigned char)digest[cut] & 0xC0) == 0x80) --cut;
  digest.resize(cut);
  digest += "...";
  return digest;
}

std::string AuditEntryToJsonLine(const AuditLogEntry &entry) {
  json obj = {
      {"timestamp", entry.timestamp},
      {"method", entry.method},
  };
  if (!entry.tool.empty()) obj["tool"] = entry.tool;
  obj["params"] = entry.params_digest;
  obj["duration_ms"] = entry.duration_ms;
  obj["outcome"] = entry.success ? "success" : "error";
  if (!entry.success) {
    obj["error_code"] = entry.error_code;
    obj["reason"] = entry.reason;
  }
  return obj.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

AuditLogger::AuditLogger(std::string path) : path_(std::move(path)), dir_ready_(false), write_failures_(0) {}

void AuditLogger::Append(const AuditLogEntry &entry) {
  const std::string line = AuditEntryToJsonLine(entry);
  std::lock_guard<std::mutex> lock(mu_);
  if (!dir_ready_) {
    const size_t slash = path_.find_last_of('/');
    if (slash != std::string::npos && !make_dirs(path_.substr(0, slash))) {
      write_failures_.fetch_add(1);
      log_event("AUDIT_WRITE_FAILED", 0, "mkdir " + path_ + ": " + std::strerror(errno));
      return;
    }
    dir_ready_ = true;
  }
  const int fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
  if (fd < 0) {
    write_failures_.fetch_add(1);
    log_event("AUDIT_WRITE_FAILED", 0, "open " + path_ + ": " + std::strerror(errno));
    return;
  }
  if (!write_all(fd, line)) {
    write_failures_.fetch_add(1);
    log_event("AUDIT_WRITE_FAILED", 0, "write " + path_ + ": " + std::strerror(errno));
  }
  close(fd);
}

}  // namespace kitrun

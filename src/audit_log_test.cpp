#include "audit_log.h"

#include <stdlib.h>
#include <sys/stat.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace {

using json = nlohmann::json;

bool require(bool cond, const char* msg) {
  if (cond) return true;
  std::cerr << "[audit_log_test] FAIL: " << msg << "\n";
  return false;
}

}  // namespace

int main() {
  bool ok = true;

  {
    // Fixed instant: 2024-12-25T10:30:45.123Z
    const std::chrono::system_clock::time_point t =
        std::chrono::system_clock::time_point(std::chrono::milliseconds(1735122645123LL));
    ok = ok && require(kitrun::FormatRfc3339Millis(t) == "2024-12-25T10:30:45.123Z", "rfc3339 with millis");
  }

  {
    const json params = {
        {"name", "scripts/greet"},
        {"arguments", {{"name", "Ada"}, {"apiKey", "abc"}, {"nested", {{"Password", "pw"}, {"keep", 1}}}}},
        {"authToken", "t"},
    };
    const json redacted = kitrun::RedactParams(params);
    ok = ok && require(redacted["authToken"] == "[REDACTED]", "token key redacted");
    ok = ok && require(redacted["arguments"]["apiKey"] == "[REDACTED]", "key suffix redacted");
    ok = ok && require(redacted["arguments"]["nested"]["Password"] == "[REDACTED]", "nested password redacted");
    ok = ok && require(redacted["arguments"]["nested"]["keep"] == 1, "plain values kept");
    ok = ok && require(redacted["arguments"]["name"] == "Ada", "name kept");
    ok = ok && require(kitrun::DigestParams(params).find("abc") == std::string::npos, "digest never shows secrets");
  }

  {
    const json big = {{"text", std::string(1000, 'x')}};
    const std::string digest = kitrun::DigestParams(big);
    ok = ok && require(digest.size() == kitrun::kAuditDigestMaxBytes + 3, "digest cut to the cap plus ellipsis");
    ok = ok && require(digest.compare(digest.size() - 3, 3, "...") == 0, "digest ends with ellipsis");

    // Two-byte characters must not be split.
    std::string accents;
    for (int i = 0; i < 200; ++i) accents += "\xc3\xa9";
    const std::string cut = kitrun::DigestParams(json{{"t", accents}}, 11);
    const std::string body = cut.substr(0, cut.size() - 3);
    ok = ok && require(json::parse("\"" + body.substr(body.find(":\"") + 2) + "\"", nullptr, false).is_discarded() ==
                           false,
                       "truncated digest is valid UTF-8");
  }

  {
    kitrun::AuditLogEntry ok_entry;
    ok_entry.timestamp = "2024-12-25T10:30:45.123Z";
    ok_entry.method = "tools/call";
    ok_entry.tool = "scripts/greet";
    ok_entry.params_digest = "{}";
    ok_entry.duration_ms = 12;
    const json a = json::parse(kitrun::AuditEntryToJsonLine(ok_entry));
    ok = ok && require(a["outcome"] == "success" && !a.contains("error_code") && !a.contains("reason"),
                       "success line has no error fields");
    ok = ok && require(a["duration_ms"] == 12 && a["tool"] == "scripts/greet", "success line fields");

    kitrun::AuditLogEntry bad = ok_entry;
    bad.tool.clear();
    bad.success = false;
    bad.error_code = -32601;
    bad.reason = "Method not found: x";
    const std::string line = kitrun::AuditEntryToJsonLine(bad);
    ok = ok && require(line.back() == '\n', "line ends with newline");
    const json b = json::parse(line);
    ok = ok && require(b["outcome"] == "error" && b["error_code"] == -32601 && b["reason"] == "Method not found: x",
                       "error line fields");
    ok = ok && require(!b.contains("tool"), "empty tool omitted");
  }

  {
    char tmpl[] = "/tmp/kitrun_audit_XXXXXX";
    if (!mkdtemp(tmpl)) return 1;
    const std::string path = std::string(tmpl) + "/logs/deep/audit.jsonl";
    kitrun::AuditLogger logger(path);
    kitrun::AuditLogEntry entry;
    entry.timestamp = kitrun::FormatRfc3339Millis(std::chrono::system_clock::now());
    entry.method = "initialize";
    logger.Append(entry);
    logger.Append(entry);
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    int lines = 0;
    std::string l;
    while (std::getline(ss, l)) ++lines;
    ok = ok && require(lines == 2, "two lines appended, directories created");
    struct stat st;
    ok = ok && require(stat(path.c_str(), &st) == 0 && (st.st_mode & 0777) == 0600, "audit file is 0600");

    kitrun::AuditLogger broken("/dev/null/not-a-dir/audit.jsonl");
    broken.Append(entry);
    ok = ok && require(broken.write_failures() == 1, "write failure counted, not thrown");
  }

  if (!ok) return 1;
  std::cout << "[audit_log_test] PASS\n";
  return 0;
}

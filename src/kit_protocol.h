#ifndef KITRUN_KIT_PROTOCOL_H_
#define KITRUN_KIT_PROTOCOL_H_

#include <cstddef>
#include <cstdint>
#include <string>

namespace kitrun {

static constexpr const char kKitrunVersion[] = "0.4.0";
static constexpr uint32_t kProtocolVersion = 1;
static constexpr const char kJsonRpcVersion[] = "2.0";
static constexpr const char kMcpProtocolVersion[] = "2024-11-05";

static constexpr uint16_t kDefaultMcpPort = 43210;
static constexpr int kDefaultCancelGraceMs = 2000;
static constexpr int kDefaultToolCallTimeoutMs = 30 * 1000;
static constexpr int kDefaultMalformedBudget = 16;
static constexpr size_t kDefaultMaxLineBytes = 1024u * 1024u;
static constexpr size_t kDefaultStderrTailLines = 20;
static constexpr size_t kAuditDigestMaxBytes = 256;
static constexpr size_t kMaxHttpHeaderBytes = 16u * 1024u;
static constexpr size_t kMaxHttpBodyBytes = 4u * 1024u * 1024u;

enum class KitErrorCode : uint32_t {
  None = 0,
  LaunchError = 1,
  ProtocolError = 2,
  SessionClosed = 3,
  Timeout = 4,
  RpcError = 5,
  AuthError = 6,
  InvalidArgument = 7,
  IoError = 8,
};

struct KitError {
  KitErrorCode code = KitErrorCode::None;
  std::string message;
};

inline bool set_err(KitError *error, KitErrorCode code, const std::string &msg) {
  if (error) {
    error->code = code;
    error->message = msg;
  }
  return false;
}

inline const char *error_code_name(KitErrorCode code) {
  switch (code) {
    case KitErrorCode::None: return "none";
    case KitErrorCode::LaunchError: return "launch_error";
    case KitErrorCode::ProtocolError: return "protocol_error";
    case KitErrorCode::SessionClosed: return "session_closed";
    case KitErrorCode::Timeout: return "timeout";
    case KitErrorCode::RpcError: return "rpc_error";
    case KitErrorCode::AuthError: return "auth_error";
    case KitErrorCode::InvalidArgument: return "invalid_argument";
    case KitErrorCode::IoError: return "io_error";
    default: return "unknown";
  }
}

namespace rpc_error {
static constexpr int kParseError = -32700;
static constexpr int kInvalidRequest = -32600;
static constexpr int kMethodNotFound = -32601;
static constexpr int kInvalidParams = -32602;
static constexpr int kInternalError = -32603;
static constexpr int kToolTimeout = -32001;
static constexpr int kToolLaunchFailed = -32002;
}  // namespace rpc_error

}  // namespace kitrun

#endif  // KITRUN_KIT_PROTOCOL_H_

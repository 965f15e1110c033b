#pragma once

namespace relay {

// JSON-RPC error codes as constants
namespace jsonrpc {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Server-defined range; the filter pipeline reports policy blocks here
constexpr int BLOCKED_BY_POLICY = -32000;
}  // namespace jsonrpc

// Bridge-level error codes (control surface and process boundary)
namespace errors {
constexpr int kSessionNotFound = 1001;
constexpr int kFilterNotFound = 1002;
constexpr int kBridgeDown = 1003;
constexpr int kUnauthorized = 1004;
constexpr int kInvalidConfig = 1005;
constexpr int kProcessError = 1006;
constexpr int kTimeout = 1007;
constexpr int kClosed = 1008;
}  // namespace errors

}  // namespace relay

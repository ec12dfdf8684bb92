#ifndef __NG_GATEWAY_EXCEPTION__
#define __NG_GATEWAY_EXCEPTION__

#include "Headers.hpp"

namespace ng {
/**
 * @brief Every failure the gateway reports to its callers falls in exactly one
 * of these buckets.
 */
enum class ErrorKind {
  TRANSPORT_ERROR,
  PROTOCOL_ERROR,
  CONNECTION_CLOSED,
  NOT_CONNECTED,
  ALREADY_CONNECTED,
  CONNECTION_NOT_FOUND,
  API_ERROR,
  NAME_CONFLICT,
  TOOL_NOT_FOUND,
  INVALID_PARAMS,
  RESOURCE_NOT_FOUND,
  INTERNAL_ERROR,
};

/** @brief Returns the CamelCase name used in logs and outward error data. */
inline const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::TRANSPORT_ERROR:
      return "TransportError";
    case ErrorKind::PROTOCOL_ERROR:
      return "ProtocolError";
    case ErrorKind::CONNECTION_CLOSED:
      return "ConnectionClosed";
    case ErrorKind::NOT_CONNECTED:
      return "NotConnected";
    case ErrorKind::ALREADY_CONNECTED:
      return "AlreadyConnected";
    case ErrorKind::CONNECTION_NOT_FOUND:
      return "ConnectionNotFound";
    case ErrorKind::API_ERROR:
      return "ApiError";
    case ErrorKind::NAME_CONFLICT:
      return "NameConflict";
    case ErrorKind::TOOL_NOT_FOUND:
      return "ToolNotFound";
    case ErrorKind::INVALID_PARAMS:
      return "InvalidParams";
    case ErrorKind::RESOURCE_NOT_FOUND:
      return "ResourceNotFound";
    case ErrorKind::INTERNAL_ERROR:
      return "InternalError";
  }
  return "Unknown";
}

/**
 * @brief Exception thrown by every layer above the raw socket handlers.
 *
 * Socket handlers keep the -1/errno convention; the transport, rpc and
 * gateway layers translate those into a GatewayException of the right kind.
 */
class GatewayException : public std::runtime_error {
 public:
  GatewayException(ErrorKind _kind, const string& message)
      : std::runtime_error(message), kind(_kind) {}

  ErrorKind getKind() const { return kind; }

  const char* getKindName() const { return errorKindName(kind); }

 protected:
  ErrorKind kind;
};

inline std::ostream& operator<<(std::ostream& os, const GatewayException& ge) {
  return os << ge.getKindName() << ": " << ge.what();
}
}  // namespace ng

#endif  // __NG_GATEWAY_EXCEPTION__

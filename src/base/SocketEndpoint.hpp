#ifndef __NG_SOCKET_ENDPOINT__
#define __NG_SOCKET_ENDPOINT__

#include "GatewayException.hpp"
#include "Headers.hpp"

namespace ng {
/** @brief Physical transport used to reach an editor instance. */
enum class EndpointKind { TCP, UNIX, NAMED_PIPE };

inline const char *endpointKindName(EndpointKind kind) {
  switch (kind) {
    case EndpointKind::TCP:
      return "tcp";
    case EndpointKind::UNIX:
      return "unix";
    case EndpointKind::NAMED_PIPE:
      return "namedpipe";
  }
  return "unknown";
}

/**
 * @brief Where to find an editor: a host/port pair for TCP, a filesystem path
 * for a Unix socket or a pipe name for a Windows named pipe.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : kind(EndpointKind::UNIX), name(""), port(-1) {}

  explicit SocketEndpoint(const string &_path)
      : kind(EndpointKind::UNIX), name(_path), port(-1) {}

  SocketEndpoint(EndpointKind _kind, const string &_name)
      : kind(_kind), name(_name), port(-1) {}

  SocketEndpoint(const string &_name, int _port)
      : kind(EndpointKind::TCP), name(_name), port(_port) {}

  EndpointKind getKind() const { return kind; }

  const string &getName() const { return name; }

  int getPort() const { return port; }

  /**
   * @brief Parses "host:port", "[v6addr]:port" or "tcp://host:port".
   * @throws GatewayException (INVALID_PARAMS) on a malformed address.
   */
  static SocketEndpoint parseTcpAddress(const string &target) {
    string address = target;
    if (startsWith(address, "tcp://")) {
      address = address.substr(6);
    }
    string host;
    string portString;
    if (startsWith(address, "[")) {
      auto close = address.find(']');
      if (close == string::npos || close + 1 >= address.size() ||
          address[close + 1] != ':') {
        throw GatewayException(ErrorKind::INVALID_PARAMS,
                               "Invalid TCP address: " + target);
      }
      host = address.substr(1, close - 1);
      portString = address.substr(close + 2);
    } else {
      auto colon = address.rfind(':');
      if (colon == string::npos) {
        throw GatewayException(ErrorKind::INVALID_PARAMS,
                               "Missing port in TCP address: " + target);
      }
      host = address.substr(0, colon);
      portString = address.substr(colon + 1);
    }
    if (host.empty() || portString.empty() ||
        portString.find_first_not_of("0123456789") != string::npos) {
      throw GatewayException(ErrorKind::INVALID_PARAMS,
                             "Invalid TCP address: " + target);
    }
    // More than five digits cannot be a port and would overflow stoi
    int port = portString.size() > 5 ? 0 : stoi(portString);
    if (port <= 0 || port > 65535) {
      throw GatewayException(ErrorKind::INVALID_PARAMS,
                             "Port out of range in TCP address: " + target);
    }
    return SocketEndpoint(host, port);
  }

  /**
   * @brief Builds the local endpoint for a path target, picking the path
   * transport compiled for this platform.
   */
  static SocketEndpoint parsePath(const string &target) {
    string path = target;
    if (startsWith(path, "unix://")) {
      path = path.substr(7);
    }
    if (path.empty()) {
      throw GatewayException(ErrorKind::INVALID_PARAMS, "Empty socket path");
    }
#ifdef WIN32
    return SocketEndpoint(EndpointKind::NAMED_PIPE, path);
#else
    return SocketEndpoint(EndpointKind::UNIX, path);
#endif
  }

  /** @brief Guesses the endpoint kind from the shape of a target string. */
  static SocketEndpoint parse(const string &target) {
    if (startsWith(target, "tcp://")) {
      return parseTcpAddress(target);
    }
    if (startsWith(target, "unix://") || startsWith(target, "\\\\.\\pipe\\") ||
        target.find('/') != string::npos ||
        target.find('\\') != string::npos) {
      return parsePath(target);
    }
    return parseTcpAddress(target);
  }

 protected:
  EndpointKind kind;
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getKind() == EndpointKind::TCP) {
    os << self.getName() << ":" << self.getPort();
  } else {
    os << endpointKindName(self.getKind()) << ":" << self.getName();
  }
  return os;
}
}  // namespace ng

#endif  // __NG_SOCKET_ENDPOINT__

#ifndef __NG_TRANSPORT__
#define __NG_TRANSPORT__

#include "GatewayException.hpp"
#include "SocketHandler.hpp"

namespace ng {
/**
 * @brief A connected duplex byte stream: the handler that owns the descriptor
 * plus the descriptor itself.
 */
struct Stream {
  shared_ptr<SocketHandler> socketHandler;
  int fd;
  SocketEndpoint endpoint;
};

/**
 * @brief Opens streams to editor instances. No retries happen here; every
 * failure is a TRANSPORT_ERROR carrying the original cause.
 */
class Transport {
 public:
  /**
   * @brief Connects to a local socket path (Unix domain socket, or named pipe
   * on Windows).
   */
  static Stream connectPath(const string& path);

  /** @brief Connects to "host:port" over TCP. */
  static Stream connectTcp(const string& address);

  /** @brief Connects to an already parsed endpoint. */
  static Stream connect(const SocketEndpoint& endpoint);

  /** @brief Creates the socket handler matching an endpoint kind. */
  static shared_ptr<SocketHandler> createSocketHandler(EndpointKind kind);
};
}  // namespace ng

#endif  // __NG_TRANSPORT__

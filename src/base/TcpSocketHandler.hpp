#ifndef __NG_TCP_SOCKET_HANDLER__
#define __NG_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace ng {
/**
 * @brief TCP transport for editors started with `--listen host:port`.
 * Both IPv4 and IPv6 are resolved; the first address that accepts wins.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on the endpoint's address and port. Port 0 picks
   * an ephemeral port; see getBoundPort().
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the requested port and closes all related fds.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

  /** @brief Returns the local port a listening socket is bound to. */
  static int getBoundPort(int fd);

  /** @brief Resolver message from the last failed connect, if any. */
  const string& getLastResolveError() const { return lastResolveError; }

 protected:
  /** @brief Tracks all listening sockets created per TCP port. */
  map<int, set<int>> portServerSockets;
  /** @brief Last resolver failure; errno is set to EHOSTUNREACH alongside. */
  string lastResolveError;

  /** @brief Adds TCP_NODELAY on top of the shared socket setup. */
  virtual void initSocket(int fd);
  /**
   * @brief Tries one resolved address.
   * @return The connected descriptor, or -1 with errno set.
   */
  int connectToAddress(const SocketEndpoint& endpoint, const addrinfo* address);
};
}  // namespace ng

#endif  // __NG_TCP_SOCKET_HANDLER__

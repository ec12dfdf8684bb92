#ifndef __NG_PIPE_SOCKET_HANDLER__
#define __NG_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace ng {
/**
 * @brief Handles Unix domain socket connections addressed by filesystem path
 * (the socket a Neovim instance opens with `--listen` or `serverstart()`).
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to a socket identified by the endpoint name.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Creates a listening Unix socket and stores it internally.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the specified path and closes its fd.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks path -> listening socket descriptors for each socket. */
  map<string, set<int>> pipeServerSockets;
};
}  // namespace ng

#endif  // __NG_PIPE_SOCKET_HANDLER__

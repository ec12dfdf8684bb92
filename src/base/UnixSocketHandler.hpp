#ifndef __NG_UNIX_SOCKET_HANDLER__
#define __NG_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace ng {
/**
 * @brief BSD socket plumbing shared by the TCP and Unix domain socket
 * handlers. Reads and writes on one descriptor are serialized by a mutex
 * owned by that descriptor.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  virtual bool waitForData(int fd, int64_t timeoutMs);
  virtual bool waitForWritable(int fd, int64_t timeoutMs);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  /** @brief Shuts the socket down and forgets it. Unknown fds are ignored. */
  virtual void close(int fd);

 protected:
  void addToActiveSockets(int fd);
  shared_ptr<recursive_mutex> getSocketMutex(int fd);
  /** @brief Makes the descriptor non-blocking and SIGPIPE free. */
  virtual void initSocket(int fd);
  /** @brief initSocket() plus SO_REUSEADDR. */
  virtual void initServerSocket(int fd);
  /**
   * @brief Waits up to timeoutMs for a non-blocking connect to finish.
   * @return 0 on success, otherwise the errno describing the failure.
   */
  int finishConnect(int sockFd, int64_t timeoutMs);

  static constexpr int64_t CONNECT_TIMEOUT_MS = 3000;

  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  recursive_mutex globalMutex;
};
}  // namespace ng

#endif  // __NG_UNIX_SOCKET_HANDLER__

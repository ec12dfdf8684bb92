#ifndef __NG_NAMED_PIPE_SOCKET_HANDLER__
#define __NG_NAMED_PIPE_SOCKET_HANDLER__

#ifdef WIN32
#include "SocketHandler.hpp"

namespace ng {
/**
 * @brief Windows named pipe client (`\\.\pipe\nvim-...`).
 *
 * Pipe handles are wrapped in CRT descriptors with _open_osfhandle so the
 * rest of the gateway keeps dealing in ints. Only the client side is
 * implemented; listen/accept are not supported.
 */
class NamedPipeSocketHandler : public SocketHandler {
 public:
  NamedPipeSocketHandler();
  virtual ~NamedPipeSocketHandler() {}

  virtual bool waitForData(int fd, int64_t timeoutMs);
  /** @brief Pipe writes block, so the pipe always counts as writable. */
  virtual bool waitForWritable(int fd, int64_t timeoutMs) { return true; }
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int connect(const SocketEndpoint& endpoint);
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual int accept(int fd);
  virtual void stopListening(const SocketEndpoint& endpoint);
  virtual void close(int fd);

 protected:
  HANDLE getHandle(int fd);

  /** @brief Serializes writes per pipe. */
  map<int, shared_ptr<recursive_mutex>> activePipeMutexes;
  recursive_mutex globalMutex;
};
}  // namespace ng
#endif

#endif  // __NG_NAMED_PIPE_SOCKET_HANDLER__

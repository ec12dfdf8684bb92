#ifndef __NG_SOCKET_HANDLER__
#define __NG_SOCKET_HANDLER__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace ng {
/**
 * @brief Descriptor level API shared by every transport the gateway speaks:
 * TCP, Unix domain sockets and Windows named pipes.
 *
 * Handlers keep the -1/errno convention. Descriptors are non-blocking;
 * callers wait with waitForData()/waitForWritable() before touching them.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Waits up to timeoutMs for fd to become readable. A hung up or
   * failed descriptor counts as readable so the next read reports it.
   */
  virtual bool waitForData(int fd, int64_t timeoutMs) = 0;
  /** @brief Waits up to timeoutMs for room in the send buffer. */
  virtual bool waitForWritable(int fd, int64_t timeoutMs) = 0;
  /** @brief One non-blocking read. 0 means the peer hung up. */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /** @brief One non-blocking write; may write less than count. */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Writes every byte, waiting out a full send buffer.
   * @throws std::runtime_error when the descriptor fails or no progress is
   * made for WRITE_STALL_TIMEOUT_MS.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count);

  /**
   * @brief Opens a connection to the endpoint.
   * @return The descriptor, or -1 with errno describing the cause.
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /** @brief Starts listening and returns the listening descriptors. */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /** @brief Accepts one pending connection, -1 when none is waiting. */
  virtual int accept(int fd) = 0;
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  virtual void close(int fd) = 0;

  static constexpr int64_t WRITE_STALL_TIMEOUT_MS = 10 * 1000;
};
}  // namespace ng

#endif  // __NG_SOCKET_HANDLER__

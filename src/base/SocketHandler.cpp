#include "SocketHandler.hpp"

namespace ng {
void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count) {
  auto lastProgress = std::chrono::steady_clock::now();
  size_t pos = 0;
  while (pos < count) {
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    if (bytesWritten > 0) {
      pos += bytesWritten;
      lastProgress = std::chrono::steady_clock::now();
      continue;
    }
    if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during write");
    }
    auto localErrno = GetErrno();
    if (localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
      LOG(WARNING) << "Write to fd " << fd
                   << " failed: " << strerror(localErrno);
      throw std::runtime_error(string("Write failed: ") +
                               strerror(localErrno));
    }
    if (std::chrono::steady_clock::now() - lastProgress >
        std::chrono::milliseconds(WRITE_STALL_TIMEOUT_MS)) {
      throw std::runtime_error("Write stalled: peer is not reading");
    }
    VLOG(4) << "Send buffer full on fd " << fd << ", waiting";
    waitForWritable(fd, 100);
  }
}
}  // namespace ng

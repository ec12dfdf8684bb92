#include "UnixSocketHandler.hpp"

namespace ng {
namespace {
// Returns the revents of a single-descriptor poll, 0 on timeout, -1 on error.
int pollOne(int fd, short events, int64_t timeoutMs) {
#ifdef WIN32
  WSAPOLLFD pfd;
  pfd.fd = (SOCKET)fd;
  pfd.events = events;
  pfd.revents = 0;
  int n = WSAPoll(&pfd, 1, int(timeoutMs));
#else
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = events;
  pfd.revents = 0;
  int n = ::poll(&pfd, 1, int(timeoutMs));
#endif
  if (n <= 0) {
    return n;
  }
  return pfd.revents;
}
}  // namespace

UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t timeoutMs) {
  int revents = pollOne(fd, POLLIN, timeoutMs);
  if (revents < 0) {
    VLOG(4) << "poll on " << fd << " failed: " << strerror(GetErrno());
    return false;
  }
  return (revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

bool UnixSocketHandler::waitForWritable(int fd, int64_t timeoutMs) {
  int revents = pollOne(fd, POLLOUT, timeoutMs);
  return revents > 0 && (revents & (POLLOUT | POLLHUP | POLLERR)) != 0;
}

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketMutex(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return nullptr;
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (fd < 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Read from closed socket " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
#ifdef WIN32
  ssize_t readBytes = ::recv(fd, (char *)buf, int(count), 0);
#else
  ssize_t readBytes = ::read(fd, buf, count);
#endif
  auto localErrno = GetErrno();
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading fd " << fd << ": " << strerror(localErrno);
  }
  VLOG(4) << "Read " << readBytes << " bytes from fd " << fd;
  SetErrno(localErrno);
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  if (fd < 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Write to closed socket " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
#ifdef WIN32
  return ::send(fd, (const char *)buf, int(count), 0);
#elif defined(MSG_NOSIGNAL)
  return ::send(fd, buf, count, MSG_NOSIGNAL);
#else
  return ::write(fd, buf, count);
#endif
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  if (!activeSocketMutexes.insert(make_pair(fd, make_shared<recursive_mutex>()))
           .second) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
}

int UnixSocketHandler::accept(int sockFd) {
  sockaddr_storage client;
  socklen_t c = sizeof(sockaddr_storage);
  int clientFd = ::accept(sockFd, (sockaddr *)&client, &c);
  auto acceptErrno = GetErrno();
  if (clientFd >= 0) {
    VLOG(3) << "Listener " << sockFd << " accepted fd " << clientFd;
    addToActiveSockets(clientFd);
    initSocket(clientFd);
    return clientFd;
  }
  if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Accept failed on " << sockFd << ": "
                 << strerror(acceptErrno);
  }
  SetErrno(acceptErrno);
  return -1;
}

void UnixSocketHandler::close(int fd) {
  if (fd < 0) {
    return;
  }
  lock_guard<recursive_mutex> globalGuard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    LOG(WARNING) << "Tried to close a socket that doesn't exist: " << fd;
    return;
  }
  auto socketMutex = it->second;
  lock_guard<recursive_mutex> guard(*socketMutex);
  VLOG(1) << "Closing socket " << fd;
#ifdef WIN32
  ::shutdown(fd, SD_BOTH);
  FATAL_FAIL(::closesocket(fd));
#else
  ::shutdown(fd, SHUT_RDWR);
  FATAL_FAIL(::close(fd));
#endif
  activeSocketMutexes.erase(it);
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL) && !defined(WIN32)
  {
    // Without MSG_NOSIGNAL, ask for SO_NOSIGPIPE instead
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
#ifdef WIN32
  u_long nonBlocking = 1;
  auto result = ioctlsocket(fd, FIONBIO, &nonBlocking);
  if (result != NO_ERROR) {
    STFATAL << "ioctlsocket failed: " << result;
  }
#else
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));
#endif
}

void UnixSocketHandler::initServerSocket(int fd) {
  initSocket(fd);
  int flag = 1;
  FATAL_FAIL(
      setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, (char *)&flag, sizeof(int)));
}

int UnixSocketHandler::finishConnect(int sockFd, int64_t timeoutMs) {
  int revents = pollOne(sockFd, POLLOUT, timeoutMs);
  if (revents == 0) {
    return ETIMEDOUT;
  }
  if (revents < 0) {
    return GetErrno();
  }
  int soError = 0;
  socklen_t len = sizeof soError;
  FATAL_FAIL(
      ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char *)&soError, &len));
  return soError;
}
}  // namespace ng

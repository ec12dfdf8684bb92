#ifndef WIN32
#include "PipeSocketHandler.hpp"

namespace ng {
namespace {
// Fills a sockaddr_un for the path. Returns false when the path does not fit.
bool fillAddress(const string& path, sockaddr_un* address) {
  if (path.length() >= sizeof(address->sun_path)) {
    return false;
  }
  memset(address, 0, sizeof(sockaddr_un));
  address->sun_family = AF_UNIX;
  strncpy(address->sun_path, path.c_str(), sizeof(address->sun_path) - 1);
  return true;
}
}  // namespace

PipeSocketHandler::PipeSocketHandler() {}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  sockaddr_un remote;
  if (!fillAddress(endpoint.getName(), &remote)) {
    LOG(ERROR) << "Socket path too long: " << endpoint.getName();
    SetErrno(ENAMETOOLONG);
    return -1;
  }

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);
  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int connectErrno = 0;
  if (::connect(sockFd, (sockaddr*)&remote, sizeof(sockaddr_un)) < 0) {
    connectErrno = GetErrno();
  }
  // Unix sockets report a full backlog as EAGAIN rather than EINPROGRESS
  if (connectErrno == EINPROGRESS || connectErrno == EAGAIN) {
    connectErrno = finishConnect(sockFd, CONNECT_TIMEOUT_MS);
  }
  if (connectErrno != 0) {
    LOG(INFO) << "Connect to " << endpoint << " failed: "
              << strerror(connectErrno);
    FATAL_FAIL(::close(sockFd));
    SetErrno(connectErrno);
    return -1;
  }

  LOG(INFO) << "Connected to endpoint " << endpoint << " using fd " << sockFd;
  addToActiveSockets(sockFd);
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local;
  if (!fillAddress(pipePath, &local)) {
    throw runtime_error("Socket path too long: " + pipePath);
  }

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);
  // A stale socket file from a previous run blocks bind()
  unlink(local.sun_path);

  FATAL_FAIL(::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)));
  FATAL_FAIL(::listen(fd, 5));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));
  addToActiveSockets(fd);

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to stop listening to a pipe that we weren't listening on:"
            << pipePath;
  }
  int sockFd = *(it->second.begin());
  pipeServerSockets.erase(it);
  close(sockFd);
  ::unlink(pipePath.c_str());
}
}  // namespace ng
#endif

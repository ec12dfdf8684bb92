#include "TcpSocketHandler.hpp"

namespace ng {
TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connectToAddress(const SocketEndpoint &endpoint,
                                       const addrinfo *address) {
  int sockFd =
      ::socket(address->ai_family, address->ai_socktype, address->ai_protocol);
  if (sockFd < 0) {
    auto localErrno = GetErrno();
    VLOG(1) << "socket() failed for family " << address->ai_family << ": "
            << strerror(localErrno);
    SetErrno(localErrno);
    return -1;
  }
  // The descriptor stays non-blocking once connected
  initSocket(sockFd);
  int connectErrno = 0;
  if (::connect(sockFd, address->ai_addr, address->ai_addrlen) < 0) {
    connectErrno = GetErrno();
  }
  if (connectErrno == EINPROGRESS || connectErrno == EWOULDBLOCK) {
    connectErrno = finishConnect(sockFd, CONNECT_TIMEOUT_MS);
  }
  if (connectErrno != 0) {
    LOG(INFO) << "Connect to " << endpoint << " failed: "
              << strerror(connectErrno);
#ifdef WIN32
    ::closesocket(sockFd);
#else
    ::close(sockFd);
#endif
    SetErrno(connectErrno);
    return -1;
  }
  return sockFd;
}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  lastResolveError.clear();

  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
#if __NetBSD__
  hints.ai_flags = AI_ADDRCONFIG;
#else
  hints.ai_flags = (AI_V4MAPPED | AI_ADDRCONFIG);
#endif
  addrinfo *results = NULL;
  int rc = getaddrinfo(endpoint.getName().c_str(),
                       to_string(endpoint.getPort()).c_str(), &hints, &results);
  if (rc != 0) {
    lastResolveError = gai_strerror(rc);
    LOG(ERROR) << "Cannot resolve " << endpoint << ": " << lastResolveError;
    SetErrno(EHOSTUNREACH);
    return -1;
  }

  int sockFd = -1;
  int lastErrno = ECONNREFUSED;
  for (const addrinfo *p = results; p != NULL && sockFd < 0; p = p->ai_next) {
    sockFd = connectToAddress(endpoint, p);
    if (sockFd < 0) {
      lastErrno = GetErrno();
    }
  }
  freeaddrinfo(results);

  if (sockFd < 0) {
    LOG(ERROR) << "Could not connect to " << endpoint;
    SetErrno(lastErrno);
    return -1;
  }
  LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
  addToActiveSockets(sockFd);
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.getPort();
  if (port != 0 && portServerSockets.find(port) != portServerSockets.end()) {
    throw std::runtime_error("Tried to listen twice on the same port");
  }

  addrinfo hints, *servinfo, *p;
  int rc;

  memset(&hints, 0, sizeof hints);
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  std::string portname = std::to_string(port);
  const char *hostname =
      endpoint.getName().empty() ? NULL : endpoint.getName().c_str();

  if ((rc = getaddrinfo(hostname, portname.c_str(), &hints, &servinfo)) != 0) {
    throw std::runtime_error(string("Error getting address info: ") +
                             gai_strerror(rc));
  }

  set<int> serverSockets;
  // loop through all the results and bind to the first we can
  for (p = servinfo; p != NULL; p = p->ai_next) {
    int sockFd;
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket " << p->ai_family << "/"
                << p->ai_socktype << "/" << p->ai_protocol << ": " << errno
                << " " << strerror(errno);
      continue;
    }
    initServerSocket(sockFd);

    if (p->ai_family == AF_INET6) {
      int flag = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, (char *)&flag,
                            sizeof(int)));
    }

    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      // This most often happens because the port is in use.
      stringstream oss;
      oss << "Error binding port " << port << ": " << errno << " "
          << strerror(errno);
      string s = oss.str();
      LOG(ERROR) << s;
      ::close(sockFd);
      freeaddrinfo(servinfo);
      throw std::runtime_error(s.c_str());
    }

    FATAL_FAIL(::listen(sockFd, 32));
    addToActiveSockets(sockFd);
    LOG(INFO) << "Listening on " << endpoint << " (bound port "
              << getBoundPort(sockFd) << ")";
    serverSockets.insert(sockFd);
    if (port == 0) {
      // An ephemeral port differs per address family, one socket is enough
      break;
    }
  }
  freeaddrinfo(servinfo);

  if (serverSockets.empty()) {
    throw std::runtime_error("Could not bind to any interface!");
  }

  portServerSockets[port == 0 ? getBoundPort(*serverSockets.begin()) : port] =
      serverSockets;
  return serverSockets;
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.getPort();
  auto it = portServerSockets.find(port);
  if (it == portServerSockets.end()) {
    STFATAL << "Tried to stop listening to a port that we weren't listening on";
  }
  auto serverSockets = it->second;
  portServerSockets.erase(it);
  for (int sockFd : serverSockets) {
    close(sockFd);
  }
}

int TcpSocketHandler::getBoundPort(int fd) {
  sockaddr_storage addr;
  socklen_t len = sizeof(addr);
  FATAL_FAIL(::getsockname(fd, (sockaddr *)&addr, &len));
  if (addr.ss_family == AF_INET6) {
    return ntohs(((sockaddr_in6 *)&addr)->sin6_port);
  }
  return ntohs(((sockaddr_in *)&addr)->sin_port);
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace ng

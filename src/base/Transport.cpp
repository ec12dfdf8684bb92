#include "Transport.hpp"

#include "TcpSocketHandler.hpp"
#ifdef WIN32
#include "NamedPipeSocketHandler.hpp"
#else
#include "PipeSocketHandler.hpp"
#endif

namespace ng {
Stream Transport::connectPath(const string& path) {
  return connect(SocketEndpoint::parsePath(path));
}

Stream Transport::connectTcp(const string& address) {
  return connect(SocketEndpoint::parseTcpAddress(address));
}

Stream Transport::connect(const SocketEndpoint& endpoint) {
  auto socketHandler = createSocketHandler(endpoint.getKind());
  int fd = socketHandler->connect(endpoint);
  if (fd < 0) {
    auto localErrno = GetErrno();
    string cause = strerror(localErrno);
    auto tcpHandler = dynamic_pointer_cast<TcpSocketHandler>(socketHandler);
    if (tcpHandler && !tcpHandler->getLastResolveError().empty()) {
      cause = tcpHandler->getLastResolveError();
    }
    ostringstream oss;
    oss << "Failed to connect to " << endpoint << ": " << cause;
    throw GatewayException(ErrorKind::TRANSPORT_ERROR, oss.str());
  }
  return Stream{socketHandler, fd, endpoint};
}

shared_ptr<SocketHandler> Transport::createSocketHandler(EndpointKind kind) {
  switch (kind) {
    case EndpointKind::TCP:
      return shared_ptr<SocketHandler>(new TcpSocketHandler());
    case EndpointKind::UNIX:
#ifdef WIN32
      throw GatewayException(ErrorKind::TRANSPORT_ERROR,
                             "Unix domain sockets are not available on this "
                             "platform, use a named pipe");
#else
      return shared_ptr<SocketHandler>(new PipeSocketHandler());
#endif
    case EndpointKind::NAMED_PIPE:
#ifdef WIN32
      return shared_ptr<SocketHandler>(new NamedPipeSocketHandler());
#else
      throw GatewayException(ErrorKind::TRANSPORT_ERROR,
                             "Named pipes are only available on Windows");
#endif
  }
  STFATAL << "Unknown endpoint kind";
  return nullptr;
}
}  // namespace ng

#ifdef WIN32
#include "NamedPipeSocketHandler.hpp"

namespace ng {
namespace {
int translateWinError(DWORD error) {
  switch (error) {
    case ERROR_FILE_NOT_FOUND:
    case ERROR_PATH_NOT_FOUND:
      return ENOENT;
    case ERROR_PIPE_BUSY:
    case ERROR_SEM_TIMEOUT:
      return ETIMEDOUT;
    case ERROR_ACCESS_DENIED:
      return EACCES;
    case ERROR_BROKEN_PIPE:
    case ERROR_NO_DATA:
    case ERROR_PIPE_NOT_CONNECTED:
      return EPIPE;
    default:
      return EIO;
  }
}
}  // namespace

NamedPipeSocketHandler::NamedPipeSocketHandler() {}

HANDLE NamedPipeSocketHandler::getHandle(int fd) {
  return (HANDLE)_get_osfhandle(fd);
}

bool NamedPipeSocketHandler::waitForData(int fd, int64_t timeoutMs) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeoutMs);
  while (true) {
    DWORD available = 0;
    if (!PeekNamedPipe(getHandle(fd), NULL, 0, NULL, &available, NULL)) {
      // A broken pipe is "readable": the next read reports the closure.
      return true;
    }
    if (available > 0) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

ssize_t NamedPipeSocketHandler::read(int fd, void* buf, size_t count) {
  DWORD bytesRead = 0;
  if (!ReadFile(getHandle(fd), buf, (DWORD)count, &bytesRead, NULL)) {
    DWORD error = GetLastError();
    if (error == ERROR_BROKEN_PIPE) {
      return 0;
    }
    SetErrno(translateWinError(error));
    return -1;
  }
  return bytesRead;
}

ssize_t NamedPipeSocketHandler::write(int fd, const void* buf, size_t count) {
  shared_ptr<recursive_mutex> pipeMutex;
  {
    lock_guard<recursive_mutex> guard(globalMutex);
    auto it = activePipeMutexes.find(fd);
    if (it == activePipeMutexes.end()) {
      SetErrno(EPIPE);
      return -1;
    }
    pipeMutex = it->second;
  }
  lock_guard<recursive_mutex> guard(*pipeMutex);
  DWORD bytesWritten = 0;
  if (!WriteFile(getHandle(fd), buf, (DWORD)count, &bytesWritten, NULL)) {
    SetErrno(translateWinError(GetLastError()));
    return -1;
  }
  return bytesWritten;
}

int NamedPipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  const string& pipeName = endpoint.getName();
  HANDLE pipe = INVALID_HANDLE_VALUE;
  for (int attempt = 0; attempt < 2; ++attempt) {
    pipe = CreateFileA(pipeName.c_str(), GENERIC_READ | GENERIC_WRITE, 0, NULL,
                       OPEN_EXISTING, 0, NULL);
    if (pipe != INVALID_HANDLE_VALUE) {
      break;
    }
    DWORD error = GetLastError();
    if (error != ERROR_PIPE_BUSY || !WaitNamedPipeA(pipeName.c_str(), 3000)) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << error;
      SetErrno(translateWinError(error));
      return -1;
    }
  }
  if (pipe == INVALID_HANDLE_VALUE) {
    SetErrno(ETIMEDOUT);
    return -1;
  }
  int fd = _open_osfhandle((intptr_t)pipe, _O_BINARY);
  if (fd < 0) {
    CloseHandle(pipe);
    SetErrno(EMFILE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(globalMutex);
  activePipeMutexes.insert(
      make_pair(fd, shared_ptr<recursive_mutex>(new recursive_mutex())));
  LOG(INFO) << "Connected to endpoint " << endpoint << " using fd " << fd;
  return fd;
}

set<int> NamedPipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  throw runtime_error("Listening on named pipes is not supported");
}

int NamedPipeSocketHandler::accept(int fd) {
  SetErrno(EINVAL);
  return -1;
}

void NamedPipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {}

void NamedPipeSocketHandler::close(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  auto it = activePipeMutexes.find(fd);
  if (it == activePipeMutexes.end()) {
    LOG(WARNING) << "Tried to close a pipe that doesn't exist: " << fd;
    return;
  }
  auto m = it->second;
  lock_guard<recursive_mutex> pipeGuard(*m);
  // _close also closes the underlying handle
  _close(fd);
  activePipeMutexes.erase(it);
}
}  // namespace ng
#endif

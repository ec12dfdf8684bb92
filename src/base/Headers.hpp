#ifndef __NG_HEADERS__
#define __NG_HEADERS__

#if defined(_MSC_VER)
#include <WinSock2.h>
#include <Ws2tcpip.h>
#include <fcntl.h>
#include <io.h>
#include <signal.h>
#include <windows.h>
#include <winerror.h>
inline int close(int fd) { return ::closesocket(fd); }
#else
#include <signal.h>
#endif

#ifdef WIN32
#else
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <pthread.h>
#include <resolv.h>
#include <poll.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#endif

#include <errno.h>
#include <fcntl.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <iomanip>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include <msgpack.hpp>

#include "nlohmann/json.hpp"

#include "ThreadPool.h"
#include "easylogging++.h"

#if !defined(__ANDROID__)
#include "ust.hpp"
#endif

#if defined(_MSC_VER)
/* ssize_t is not defined on Windows */
#include <BaseTsd.h>
#define ssize_t SSIZE_T
#endif

using namespace std;
using json = nlohmann::json;

// Name of the notification armed by the diagnostics autocmd
const string DIAGNOSTICS_CHANGED_NOTIFICATION = "NVIM_MCP_DiagnosticsChanged";

// Length of a freshly generated connection id (hex digits)
const int CONNECTION_ID_LENGTH = 7;

#if defined(__ANDROID__)
#define STFATAL LOG(FATAL) << "No Stack Trace on Android" << endl

#define STERROR LOG(ERROR) << "No Stack Trace on Android" << endl
#else
#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()
#endif

inline int GetErrno() {
#ifdef WIN32
  // Winsock codes are mapped onto errno values so callers compare one set
  auto retval = WSAGetLastError();
  switch (retval) {
    case WSAEWOULDBLOCK:
      return EWOULDBLOCK;
    case WSAEINPROGRESS:
      return EINPROGRESS;
    case WSAECONNRESET:
      return ECONNRESET;
    case WSAECONNABORTED:
      return ECONNABORTED;
    case WSAECONNREFUSED:
      return ECONNREFUSED;
    case WSAETIMEDOUT:
      return ETIMEDOUT;
    case WSAEHOSTUNREACH:
    case WSAENETUNREACH:
      return EHOSTUNREACH;
    default:
      return retval >= 10000 ? EIO : retval;
  }
#else
  return errno;
#endif
}

inline void SetErrno(int e) {
#ifdef WIN32
  WSASetLastError(e);
#else
  errno = e;
#endif
}

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef NG_VERSION
#define NG_VERSION "unknown"
#endif

namespace ng {
inline bool startsWith(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() &&
         s.compare(0, prefix.size(), prefix) == 0;
}

inline string GetTempDirectory() {
#ifdef WIN32
  char buf[MAX_PATH + 1];
  DWORD retval = GetTempPathA(MAX_PATH + 1, buf);
  string tmpDir(buf, retval);
#else
  string tmpDir = _PATH_TMP;
#endif
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  ::exit(signum);
}
}  // namespace ng

#endif

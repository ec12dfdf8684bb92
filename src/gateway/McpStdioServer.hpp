#ifndef __NG_MCP_STDIO_SERVER__
#define __NG_MCP_STDIO_SERVER__

#include "Gateway.hpp"
#include "Headers.hpp"

namespace ng {
/**
 * @brief Newline-delimited JSON-RPC 2.0 endpoint speaking the MCP subset the
 * gateway needs.
 *
 * Requests run on a thread pool so a slow editor never blocks the read loop;
 * responses are written whole under a mutex.
 */
class McpStdioServer {
 public:
  McpStdioServer(shared_ptr<Gateway> _gateway, int threads, istream& _in,
                 ostream& _out);
  virtual ~McpStdioServer();

  /** @brief Serves until the input stream ends, then drains requests. */
  void run();

  /**
   * @brief Handles one decoded message.
   * @return The response, or null for notifications.
   */
  json handleMessage(const json& message);

  void sendNotification(const string& method, const json& params);

  static int errorCodeFor(ErrorKind kind);

 protected:
  shared_ptr<Gateway> gateway;
  istream& in;
  ostream& out;
  mutex outMutex;
  shared_ptr<ThreadPool> pool;
  int threads;

  mutex cancelMutex;
  // Requests in flight, keyed by the dumped JSON-RPC id
  unordered_map<string, bool> inFlight;

  void handleLine(const string& line);
  void runRequest(const json& request);
  /** @return nullopt for methods this server does not implement. */
  optional<json> invoke(const string& method, const json& params);
  void writeMessage(const json& message);
  void cancel(const json& params);

  static json errorResponse(const json& id, int code, const string& message,
                            const string& kind);
};
}  // namespace ng

#endif  // __NG_MCP_STDIO_SERVER__

#ifndef __NG_RPC_CLIENT__
#define __NG_RPC_CLIENT__

#include "GatewayException.hpp"
#include "Headers.hpp"
#include "RpcMessage.hpp"
#include "Transport.hpp"

namespace ng {
/**
 * @brief One multiplexed msgpack-rpc connection to an editor instance.
 *
 * Any number of threads may call() concurrently. A single reader thread owns
 * the read side of the stream: it decodes every incoming frame, resolves the
 * pending call that matches the response msgid and hands notifications to a
 * dedicated worker so that slow subscribers never stall responses.
 *
 * Once the stream closes (peer EOF, IO error, malformed data or shutdown())
 * the client is dead for good: every outstanding call fails and later calls
 * fail immediately with CONNECTION_CLOSED.
 */
class RpcClient {
 public:
  typedef std::function<void(const json& params)> NotificationHandler;

  explicit RpcClient(const Stream& _stream);
  virtual ~RpcClient();

  /**
   * @brief Sends a request and blocks until its response arrives or the
   * connection goes away.
   * @throws GatewayException API_ERROR when the remote side reports an error,
   * CONNECTION_CLOSED/PROTOCOL_ERROR on teardown, TRANSPORT_ERROR when the
   * request could not be written.
   */
  json call(const string& method, const json& params);

  /**
   * @brief Like call(), but gives up waiting after timeoutMs (<= 0 waits
   * forever). A timed-out call surfaces as TRANSPORT_ERROR; its response is
   * discarded whenever it shows up.
   */
  json call(const string& method, const json& params, int64_t timeoutMs);

  /**
   * @brief Sends a request and returns without waiting. Dropping the future
   * abandons the call.
   */
  future<json> callAsync(const string& method, const json& params);

  /** @brief Sends a notification frame. No answer is expected. */
  void notify(const string& method, const json& params);

  /**
   * @brief Routes every notification named `method` to `handler`, replacing
   * any earlier handler. Handlers run on the notification worker in arrival
   * order.
   */
  void subscribe(const string& method, NotificationHandler handler);

  void unsubscribe(const string& method);

  /**
   * @brief Stops the reader, fails all pending calls and closes the stream.
   * Safe to call more than once.
   */
  void shutdown();

  bool isClosed();

  /** @brief Number of requests still waiting for a response. */
  size_t getPendingCount();

  const SocketEndpoint& getEndpoint() const { return stream.endpoint; }

 protected:
  typedef shared_ptr<promise<json>> PendingCall;

  Stream stream;
  atomic<uint32_t> nextMsgid;
  atomic<bool> shuttingDown;

  mutex pendingMutex;
  unordered_map<uint32_t, PendingCall> pending;
  bool closed;

  mutex writeMutex;
  bool streamClosed;

  mutex subscriptionMutex;
  unordered_map<string, NotificationHandler> subscriptions;

  shared_ptr<ThreadPool> notificationPool;
  std::thread readerThread;

  void readerLoop();
  void handleMessage(const RpcMessage& message);
  void handleResponse(const RpcMessage& message);
  void handleNotification(const RpcMessage& message);
  void rejectRequest(const RpcMessage& message);

  /** @brief Fails every pending call with `kind` and refuses new ones. */
  void teardown(ErrorKind kind, const string& reason);

  /** @brief Writes one frame under the write mutex. */
  void writeFrame(const string& frame);

  static string remoteErrorMessage(const json& error);
};
}  // namespace ng

#endif  // __NG_RPC_CLIENT__

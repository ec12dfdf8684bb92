#include "RpcClient.hpp"

#include "MessageReader.hpp"
#include "MessageWriter.hpp"

namespace ng {
namespace {
const int READ_BUFFER_SIZE = 64 * 1024;
// How often the reader wakes up to check for shutdown
const int64_t READER_POLL_MS = 100;
}  // namespace

RpcClient::RpcClient(const Stream& _stream)
    : stream(_stream),
      nextMsgid(1),
      shuttingDown(false),
      closed(false),
      streamClosed(false),
      notificationPool(new ThreadPool(1)) {
  readerThread = std::thread(&RpcClient::readerLoop, this);
}

RpcClient::~RpcClient() { shutdown(); }

json RpcClient::call(const string& method, const json& params) {
  return call(method, params, 0);
}

json RpcClient::call(const string& method, const json& params,
                     int64_t timeoutMs) {
  auto response = callAsync(method, params);
  if (timeoutMs > 0 && response.wait_for(std::chrono::milliseconds(
                           timeoutMs)) == std::future_status::timeout) {
    LOG(WARNING) << "Call to " << method << " timed out after " << timeoutMs
                 << " ms";
    throw GatewayException(ErrorKind::TRANSPORT_ERROR,
                           "Call to " + method + " timed out after " +
                               to_string(timeoutMs) + " ms");
  }
  return response.get();
}

future<json> RpcClient::callAsync(const string& method, const json& params) {
  uint32_t msgid = nextMsgid++;
  MessageWriter writer;
  writer.writeRequest(msgid, method, params);
  string frame = writer.finish();

  auto pendingCall = make_shared<promise<json>>();
  auto response = pendingCall->get_future();
  {
    lock_guard<mutex> guard(pendingMutex);
    if (closed) {
      throw GatewayException(ErrorKind::CONNECTION_CLOSED,
                             "Connection to " +
                                 stream.endpoint.getName() + " is closed");
    }
    pending[msgid] = pendingCall;
  }

  VLOG(1) << "Sending request " << msgid << ": " << method;
  try {
    writeFrame(frame);
  } catch (const GatewayException& ge) {
    lock_guard<mutex> guard(pendingMutex);
    pending.erase(msgid);
    throw;
  }
  return response;
}

void RpcClient::notify(const string& method, const json& params) {
  {
    lock_guard<mutex> guard(pendingMutex);
    if (closed) {
      throw GatewayException(ErrorKind::CONNECTION_CLOSED,
                             "Connection to " +
                                 stream.endpoint.getName() + " is closed");
    }
  }
  MessageWriter writer;
  writer.writeNotification(method, params);
  writeFrame(writer.finish());
}

void RpcClient::subscribe(const string& method, NotificationHandler handler) {
  lock_guard<mutex> guard(subscriptionMutex);
  subscriptions[method] = handler;
}

void RpcClient::unsubscribe(const string& method) {
  lock_guard<mutex> guard(subscriptionMutex);
  subscriptions.erase(method);
}

void RpcClient::shutdown() {
  shuttingDown = true;
  if (readerThread.joinable()) {
    if (readerThread.get_id() == std::this_thread::get_id()) {
      STFATAL << "RpcClient shut down from its own reader thread";
    }
    readerThread.join();
  }
  teardown(ErrorKind::CONNECTION_CLOSED, "Client shut down");
  // Drains queued notifications, then joins the worker.
  notificationPool.reset();
  lock_guard<mutex> guard(writeMutex);
  if (!streamClosed) {
    streamClosed = true;
    stream.socketHandler->close(stream.fd);
    LOG(INFO) << "Closed rpc stream to " << stream.endpoint;
  }
}

bool RpcClient::isClosed() {
  lock_guard<mutex> guard(pendingMutex);
  return closed;
}

size_t RpcClient::getPendingCount() {
  lock_guard<mutex> guard(pendingMutex);
  return pending.size();
}

void RpcClient::readerLoop() {
  el::Helpers::setThreadName("rpc-reader");
  MessageReader reader;
  vector<char> buffer(READ_BUFFER_SIZE);
  while (!shuttingDown) {
    if (!stream.socketHandler->waitForData(stream.fd, READER_POLL_MS)) {
      continue;
    }
    ssize_t bytesRead =
        stream.socketHandler->read(stream.fd, &buffer[0], buffer.size());
    if (bytesRead == 0) {
      LOG(INFO) << "Peer closed the rpc stream to " << stream.endpoint;
      teardown(ErrorKind::CONNECTION_CLOSED, "Connection closed by peer");
      return;
    }
    if (bytesRead < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        continue;
      }
      LOG(WARNING) << "Read from " << stream.endpoint
                   << " failed: " << strerror(localErrno);
      teardown(ErrorKind::CONNECTION_CLOSED,
               string("Connection lost: ") + strerror(localErrno));
      return;
    }
    reader.feed(&buffer[0], bytesRead);
    try {
      RpcMessage message;
      while (reader.next(&message)) {
        handleMessage(message);
      }
    } catch (const GatewayException& ge) {
      LOG(ERROR) << "Malformed data from " << stream.endpoint << ": "
                 << ge.what();
      teardown(ErrorKind::PROTOCOL_ERROR, ge.what());
      return;
    }
  }
}

void RpcClient::handleMessage(const RpcMessage& message) {
  switch (message.type) {
    case RPC_RESPONSE:
      handleResponse(message);
      break;
    case RPC_NOTIFICATION:
      handleNotification(message);
      break;
    case RPC_REQUEST:
      rejectRequest(message);
      break;
  }
}

void RpcClient::handleResponse(const RpcMessage& message) {
  PendingCall pendingCall;
  {
    lock_guard<mutex> guard(pendingMutex);
    auto it = pending.find(message.msgid);
    if (it == pending.end()) {
      LOG(WARNING) << "Discarding response for unknown msgid "
                   << message.msgid;
      return;
    }
    pendingCall = it->second;
    pending.erase(it);
  }
  VLOG(1) << "Got response " << message.msgid;
  if (!message.payloadError.empty()) {
    pendingCall->set_exception(make_exception_ptr(
        GatewayException(ErrorKind::API_ERROR, message.payloadError)));
  } else if (!message.error.is_null()) {
    pendingCall->set_exception(make_exception_ptr(GatewayException(
        ErrorKind::API_ERROR, remoteErrorMessage(message.error))));
  } else {
    pendingCall->set_value(message.result);
  }
}

void RpcClient::handleNotification(const RpcMessage& message) {
  if (!message.payloadError.empty()) {
    LOG(WARNING) << "Dropping notification " << message.method << ": "
                 << message.payloadError;
    return;
  }
  NotificationHandler handler;
  {
    lock_guard<mutex> guard(subscriptionMutex);
    auto it = subscriptions.find(message.method);
    if (it == subscriptions.end()) {
      VLOG(1) << "No subscriber for notification " << message.method;
      return;
    }
    handler = it->second;
  }
  string method = message.method;
  json params = message.params;
  notificationPool->enqueue([handler, method, params] {
    el::Helpers::setThreadName("rpc-notify");
    try {
      handler(params);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Handler for " << method << " failed: " << e.what();
    }
  });
}

void RpcClient::rejectRequest(const RpcMessage& message) {
  LOG(WARNING) << "Peer sent unsupported request " << message.method;
  MessageWriter writer;
  writer.writeResponse(message.msgid,
                       json("Method not supported: " + message.method),
                       json(nullptr));
  string frame = writer.finish();
  // Writing may block, so it happens off the reader.
  notificationPool->enqueue([this, frame] {
    try {
      writeFrame(frame);
    } catch (const GatewayException& ge) {
      LOG(WARNING) << "Could not reject request: " << ge.what();
    }
  });
}

void RpcClient::teardown(ErrorKind kind, const string& reason) {
  unordered_map<uint32_t, PendingCall> failedCalls;
  {
    lock_guard<mutex> guard(pendingMutex);
    if (closed) {
      return;
    }
    closed = true;
    failedCalls.swap(pending);
  }
  if (!failedCalls.empty()) {
    LOG(INFO) << "Failing " << failedCalls.size()
              << " pending calls: " << reason;
  }
  for (auto& it : failedCalls) {
    it.second->set_exception(
        make_exception_ptr(GatewayException(kind, reason)));
  }
}

void RpcClient::writeFrame(const string& frame) {
  lock_guard<mutex> guard(writeMutex);
  if (streamClosed) {
    throw GatewayException(ErrorKind::CONNECTION_CLOSED,
                           "Connection to " + stream.endpoint.getName() +
                               " is closed");
  }
  try {
    stream.socketHandler->writeAllOrThrow(stream.fd, frame.data(),
                                          frame.size());
  } catch (const std::runtime_error& re) {
    throw GatewayException(ErrorKind::TRANSPORT_ERROR,
                           string("Write to ") + stream.endpoint.getName() +
                               " failed: " + re.what());
  }
}

string RpcClient::remoteErrorMessage(const json& error) {
  // Neovim reports errors as [type, message]
  if (error.is_array() && error.size() == 2 && error[1].is_string()) {
    return error[1].get<string>();
  }
  if (error.is_string()) {
    return error.get<string>();
  }
  if (error.is_object() && error.count("message") &&
      error["message"].is_string()) {
    return error["message"].get<string>();
  }
  return error.dump();
}
}  // namespace ng

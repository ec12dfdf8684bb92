#ifndef __NG_MESSAGE_READER__
#define __NG_MESSAGE_READER__

#include "GatewayException.hpp"
#include "Headers.hpp"
#include "MsgpackJson.hpp"
#include "RpcMessage.hpp"

namespace ng {
/**
 * @brief Incremental msgpack-rpc frame decoder.
 *
 * Bytes arrive in arbitrary chunks through feed(); next() yields frames as
 * soon as one is complete. Anything that is not a well formed frame throws
 * PROTOCOL_ERROR, after which the stream cannot be trusted any more.
 */
class MessageReader {
 public:
  MessageReader() {}

  inline void feed(const char* data, size_t size) {
    unpackHandler.reserve_buffer(size);
    memcpy(unpackHandler.buffer(), data, size);
    unpackHandler.buffer_consumed(size);
  }

  inline void feed(const string& s) { feed(s.data(), s.size()); }

  /**
   * @brief Decodes the next complete frame.
   * @return false when more bytes are needed.
   */
  inline bool next(RpcMessage* message) {
    msgpack::object_handle oh;
    try {
      if (!unpackHandler.next(oh)) {
        return false;
      }
    } catch (const msgpack::unpack_error& ue) {
      throw GatewayException(ErrorKind::PROTOCOL_ERROR,
                             string("Invalid msgpack data: ") + ue.what());
    }
    decodeFrame(oh.get(), message);
    return true;
  }

  /** @brief Decodes a single bare value, for tests and tooling. */
  inline json readValue() {
    msgpack::object_handle oh;
    if (!unpackHandler.next(oh)) {
      throw GatewayException(ErrorKind::PROTOCOL_ERROR, "Incomplete value");
    }
    return msgpackToJson(oh.get());
  }

 protected:
  msgpack::unpacker unpackHandler;

  static void protocolError(const string& message) {
    throw GatewayException(ErrorKind::PROTOCOL_ERROR, message);
  }

  static string readString(const msgpack::object& o, const char* field) {
    if (o.type != msgpack::type::STR) {
      protocolError(string("Frame field is not a string: ") + field);
    }
    if (!isValidUtf8(o.via.str.ptr, o.via.str.size)) {
      protocolError(string("Frame field is not UTF-8: ") + field);
    }
    return string(o.via.str.ptr, o.via.str.size);
  }

  static uint32_t readMsgid(const msgpack::object& o) {
    if (o.type != msgpack::type::POSITIVE_INTEGER ||
        o.via.u64 > numeric_limits<uint32_t>::max()) {
      protocolError("Frame msgid is not a 32-bit unsigned integer");
    }
    return uint32_t(o.via.u64);
  }

  static json readPayload(const msgpack::object& o, RpcMessage* message) {
    try {
      return msgpackToJson(o);
    } catch (const GatewayException& ge) {
      message->payloadError = ge.what();
      return json(nullptr);
    }
  }

  static void decodeFrame(const msgpack::object& o, RpcMessage* message) {
    *message = RpcMessage();
    if (o.type != msgpack::type::ARRAY || o.via.array.size == 0) {
      protocolError("Frame is not a non-empty array");
    }
    const msgpack::object* items = o.via.array.ptr;
    uint32_t size = o.via.array.size;
    if (items[0].type != msgpack::type::POSITIVE_INTEGER) {
      protocolError("Frame type is not an integer");
    }
    switch (items[0].via.u64) {
      case RPC_REQUEST:
        if (size != 4) {
          protocolError("Request frame must have 4 elements");
        }
        if (items[3].type != msgpack::type::ARRAY) {
          protocolError("Request params must be an array");
        }
        message->type = RPC_REQUEST;
        message->msgid = readMsgid(items[1]);
        message->method = readString(items[2], "method");
        message->params = readPayload(items[3], message);
        break;
      case RPC_RESPONSE:
        if (size != 4) {
          protocolError("Response frame must have 4 elements");
        }
        message->type = RPC_RESPONSE;
        message->msgid = readMsgid(items[1]);
        message->error = readPayload(items[2], message);
        message->result = readPayload(items[3], message);
        break;
      case RPC_NOTIFICATION:
        if (size != 3) {
          protocolError("Notification frame must have 3 elements");
        }
        if (items[2].type != msgpack::type::ARRAY) {
          protocolError("Notification params must be an array");
        }
        message->type = RPC_NOTIFICATION;
        message->method = readString(items[1], "method");
        message->params = readPayload(items[2], message);
        break;
      default:
        protocolError("Unknown frame type " + to_string(items[0].via.u64));
    }
  }
};
}  // namespace ng

#endif  // __NG_MESSAGE_READER__

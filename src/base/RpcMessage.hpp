#ifndef __NG_RPC_MESSAGE__
#define __NG_RPC_MESSAGE__

#include "Headers.hpp"

namespace ng {
/** @brief First element of every msgpack-rpc frame. */
enum RpcMessageType {
  RPC_REQUEST = 0,
  RPC_RESPONSE = 1,
  RPC_NOTIFICATION = 2,
};

/**
 * @brief One decoded msgpack-rpc frame.
 *
 * request:      [0, msgid, method, params]
 * response:     [1, msgid, error, result]
 * notification: [2, method, params]
 */
struct RpcMessage {
  RpcMessageType type = RPC_NOTIFICATION;
  uint32_t msgid = 0;
  string method;
  json params;
  json error;
  json result;
  /**
   * Set when the frame itself was well formed but its payload held values
   * that have no JSON form (binary, extension). Only the addressee of the
   * frame fails; the connection survives.
   */
  string payloadError;
};
}  // namespace ng

#endif  // __NG_RPC_MESSAGE__

#ifndef __NG_MESSAGE_WRITER__
#define __NG_MESSAGE_WRITER__

#include "Headers.hpp"
#include "MsgpackJson.hpp"
#include "RpcMessage.hpp"

namespace ng {
/**
 * @brief Packs msgpack-rpc frames. Each write* call produces exactly one
 * complete frame; finish() hands back the bytes and resets the buffer.
 */
class MessageWriter {
 public:
  MessageWriter() : packHandler(buffer) {}

  inline void start() { buffer.clear(); }

  inline void writeRequest(uint32_t msgid, const string& method,
                           const json& params) {
    packHandler.pack_array(4);
    packHandler.pack(int(RPC_REQUEST));
    packHandler.pack(msgid);
    packHandler.pack(method);
    packJson(packHandler, params);
  }

  inline void writeResponse(uint32_t msgid, const json& error,
                            const json& result) {
    packHandler.pack_array(4);
    packHandler.pack(int(RPC_RESPONSE));
    packHandler.pack(msgid);
    packJson(packHandler, error);
    packJson(packHandler, result);
  }

  inline void writeNotification(const string& method, const json& params) {
    packHandler.pack_array(3);
    packHandler.pack(int(RPC_NOTIFICATION));
    packHandler.pack(method);
    packJson(packHandler, params);
  }

  /** @brief Packs a bare value, outside of any frame. */
  inline void writeValue(const json& value) { packJson(packHandler, value); }

  /** @brief Appends raw bytes, which need not be valid msgpack. */
  inline void writeRaw(const string& s) { buffer.write(s.data(), s.size()); }

  inline string finish() {
    string s(buffer.data(), buffer.size());
    start();
    return s;
  }

  inline int64_t size() { return buffer.size(); }

 protected:
  msgpack::sbuffer buffer;
  msgpack::packer<msgpack::sbuffer> packHandler;
};
}  // namespace ng

#endif  // __NG_MESSAGE_WRITER__

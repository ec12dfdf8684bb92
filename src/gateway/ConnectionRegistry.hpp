#ifndef __NG_CONNECTION_REGISTRY__
#define __NG_CONNECTION_REGISTRY__

#include "EditorClient.hpp"
#include "GatewayException.hpp"
#include "Headers.hpp"
#include "ShardedMap.hpp"

namespace ng {
/** @brief One live editor connection. */
struct Connection {
  string id;
  string target;
  shared_ptr<EditorClient> client;
};

/**
 * @brief Concurrent map of connection id to Connection.
 *
 * Ids are short hex prefixes of a BLAKE2b hash of the target, so the same
 * target maps to the same id across runs unless it collides with another
 * live target.
 */
class ConnectionRegistry {
 public:
  ConnectionRegistry() {}

  /**
   * @brief Returns an id for `target` that no other live target holds.
   * Prefers the first CONNECTION_ID_LENGTH hex digits of the hash, extending
   * the prefix one digit at a time on collision.
   */
  string generateId(const string& target);

  /** @brief Hex BLAKE2b digest of `input`. */
  static string hashTarget(const string& input);

  /** @brief Inserts unless the id is taken. */
  bool insertIfAbsent(const Connection& connection);

  /** @throws GatewayException CONNECTION_NOT_FOUND */
  Connection get(const string& connectionId);

  /** @throws GatewayException CONNECTION_NOT_FOUND */
  Connection removeAndTake(const string& connectionId);

  optional<Connection> findByTarget(const string& target);

  bool contains(const string& connectionId);

  /** @brief All live connections, sorted by id. */
  vector<Connection> list();

  size_t size() { return connections.size(); }

 protected:
  ShardedMap<string, Connection> connections;
};
}  // namespace ng

#endif  // __NG_CONNECTION_REGISTRY__

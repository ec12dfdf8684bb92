#include "ConnectionRegistry.hpp"

namespace ng {
string ConnectionRegistry::hashTarget(const string& input) {
  unsigned char digest[crypto_generichash_BYTES];
  FATAL_FAIL(crypto_generichash(digest, sizeof(digest),
                                (const unsigned char*)input.data(),
                                input.size(), NULL, 0));
  char hex[crypto_generichash_BYTES * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), digest, sizeof(digest));
  return string(hex);
}

string ConnectionRegistry::generateId(const string& target) {
  for (int round = 0;; ++round) {
    string digest =
        hashTarget(round == 0 ? target : target + "#" + to_string(round));
    for (size_t length = CONNECTION_ID_LENGTH; length <= digest.size();
         ++length) {
      string candidate = digest.substr(0, length);
      auto existing = connections.get(candidate);
      if (!existing || existing->target == target) {
        return candidate;
      }
      VLOG(1) << "Connection id " << candidate << " is held by "
              << existing->target << ", extending";
    }
  }
}

bool ConnectionRegistry::insertIfAbsent(const Connection& connection) {
  return connections.insertIfAbsent(connection.id, connection);
}

Connection ConnectionRegistry::get(const string& connectionId) {
  auto connection = connections.get(connectionId);
  if (!connection) {
    throw GatewayException(ErrorKind::CONNECTION_NOT_FOUND,
                           "No Neovim connection found for ID: " +
                               connectionId);
  }
  return *connection;
}

Connection ConnectionRegistry::removeAndTake(const string& connectionId) {
  auto connection = connections.take(connectionId);
  if (!connection) {
    throw GatewayException(ErrorKind::CONNECTION_NOT_FOUND,
                           "No Neovim connection found for ID: " +
                               connectionId);
  }
  return *connection;
}

optional<Connection> ConnectionRegistry::findByTarget(const string& target) {
  for (const auto& it : connections.snapshot()) {
    if (it.second.target == target) {
      return it.second;
    }
  }
  return nullopt;
}

bool ConnectionRegistry::contains(const string& connectionId) {
  return connections.contains(connectionId);
}

vector<Connection> ConnectionRegistry::list() {
  vector<Connection> result;
  for (const auto& it : connections.snapshot()) {
    result.push_back(it.second);
  }
  sort(result.begin(), result.end(),
       [](const Connection& a, const Connection& b) { return a.id < b.id; });
  return result;
}
}  // namespace ng

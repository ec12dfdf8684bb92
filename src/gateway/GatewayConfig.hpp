#ifndef __NG_GATEWAY_CONFIG__
#define __NG_GATEWAY_CONFIG__

#include "Gateway.hpp"
#include "Headers.hpp"

namespace ng {
/**
 * @brief Runtime settings, from the ini file first and then overridden by
 * the command line.
 */
struct GatewayConfig {
  string logDirectory = GetTempDirectory() + "neogate";
  int verbose = 0;
  string maxLogSize = "20971520";
  bool logToStderr = false;
  int threads = 8;
  GatewayOptions gatewayOptions;

  /**
   * @brief Reads the [Logging], [Rpc] and [Server] sections of an ini file.
   * @throws GatewayException INVALID_PARAMS when the file cannot be loaded or
   * holds a bad value.
   */
  void loadIni(const string& filename);

  /** @brief Reads an ini document from memory. */
  void loadIniData(const string& data);
};
}  // namespace ng

#endif  // __NG_GATEWAY_CONFIG__

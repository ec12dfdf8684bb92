#include "GatewayConfig.hpp"

#include "SimpleIni.h"

namespace ng {
namespace {
int64_t readInteger(const CSimpleIniA& ini, const char* section,
                    const char* key, int64_t fallback) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return fallback;
  }
  try {
    size_t used = 0;
    int64_t parsed = stoll(value, &used);
    if (used != strlen(value) || parsed < 0) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw GatewayException(ErrorKind::INVALID_PARAMS,
                           string("Invalid value for ") + section + "." + key +
                               ": " + value);
  }
}

void applyIni(const CSimpleIniA& ini, GatewayConfig* config) {
  const char* logdir = ini.GetValue("Logging", "logdir", NULL);
  if (logdir && strlen(logdir)) {
    config->logDirectory = logdir;
  }
  config->verbose = int(readInteger(ini, "Logging", "verbose", config->verbose));
  int64_t logsize = readInteger(ini, "Logging", "logsize", 0);
  if (logsize != 0) {
    config->maxLogSize = to_string(logsize);
  }
  config->gatewayOptions.callTimeoutMs = readInteger(
      ini, "Rpc", "call_timeout_ms", config->gatewayOptions.callTimeoutMs);
  config->gatewayOptions.lspTimeoutMs = readInteger(
      ini, "Rpc", "lsp_timeout_ms", config->gatewayOptions.lspTimeoutMs);
  config->threads = int(readInteger(ini, "Server", "threads", config->threads));
  if (config->threads <= 0) {
    throw GatewayException(ErrorKind::INVALID_PARAMS,
                           "Server.threads must be positive");
  }
}
}  // namespace

void GatewayConfig::loadIni(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw GatewayException(ErrorKind::INVALID_PARAMS,
                           "Invalid config file: " + filename);
  }
  applyIni(ini, this);
}

void GatewayConfig::loadIniData(const string& data) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(data.c_str(), data.size());
  if (rc < 0) {
    throw GatewayException(ErrorKind::INVALID_PARAMS, "Invalid config data");
  }
  applyIni(ini, this);
}
}  // namespace ng

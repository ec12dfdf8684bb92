#ifndef __NG_LOG_HANDLER__
#define __NG_LOG_HANDLER__

#include "Headers.hpp"

namespace ng {
/**
 * @brief Configures easylogging++ for the gateway. stdout carries the
 * protocol, so log output only ever goes to files and, optionally, stderr.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param logToStderr Mirror every log line to stderr as well.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStderr = false, bool appendPid = false,
                            string maxlogsize = "20971520");

  /** @brief Rollover callback: keeps the full file as `<name>.1`. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging "stdout" logger so it just writes
   * messages. Only used before the protocol loop starts (help, version).
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new, owner-only log
   * file.
   * @throws std::runtime_error when either step fails.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace ng
#endif  // __NG_LOG_HANDLER__

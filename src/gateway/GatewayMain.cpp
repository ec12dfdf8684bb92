#include <cxxopts.hpp>

#include "GatewayConfig.hpp"
#include "LogHandler.hpp"
#include "McpStdioServer.hpp"

using namespace ng;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  // Keep stdout clean for the protocol until the log files are set up
  el::Loggers::reconfigureLogger("default", defaultConf);
  LogHandler::setupStdoutLogger();

  ng::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, ng::InterruptSignalHandler);
#ifndef WIN32
  // A vanished editor must not kill the gateway
  ::signal(SIGPIPE, SIG_IGN);
#endif

  cxxopts::Options options("neogate",
                           "Exposes running Neovim instances to MCP clients");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>())         //
        ("logtostderr", "Mirror logs to stderr")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("call-timeout-ms", "Give up on an editor call after this long, 0 "
                            "waits forever",
         cxxopts::value<int64_t>())  //
        ("lsp-timeout-ms", "Timeout for LSP requests made inside the editor",
         cxxopts::value<int64_t>())  //
        ("threads", "Number of request worker threads",
         cxxopts::value<int>())  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "neogate version " << NG_VERSION << endl;
      exit(0);
    }

    GatewayConfig config;
    if (!result["cfgfile"].as<string>().empty()) {
      config.loadIni(result["cfgfile"].as<string>());
    }
    if (result.count("logdir")) {
      config.logDirectory = result["logdir"].as<string>();
    }
    if (result.count("logtostderr")) {
      config.logToStderr = true;
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("call-timeout-ms")) {
      config.gatewayOptions.callTimeoutMs =
          result["call-timeout-ms"].as<int64_t>();
    }
    if (result.count("lsp-timeout-ms")) {
      config.gatewayOptions.lspTimeoutMs =
          result["lsp-timeout-ms"].as<int64_t>();
    }
    if (result.count("threads")) {
      config.threads = result["threads"].as<int>();
      if (config.threads <= 0) {
        throw GatewayException(ErrorKind::INVALID_PARAMS,
                               "--threads must be positive");
      }
    }

    el::Loggers::setVerboseLevel(config.verbose);
    LogHandler::setupLogFiles(&defaultConf, config.logDirectory, "neogate",
                              config.logToStderr, true, config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("neogate-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    LOG(INFO) << "Starting neogate " << NG_VERSION << " with "
              << config.threads << " workers";
    shared_ptr<Gateway> gateway(new Gateway(config.gatewayOptions));
    {
      McpStdioServer server(gateway, config.threads, cin, cout);
      server.run();
    }
    gateway->shutdown();
    LOG(INFO) << "Shut down cleanly";
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const GatewayException &ge) {
    cerr << "neogate: " << ge.what() << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    cerr << "neogate: " << re.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}

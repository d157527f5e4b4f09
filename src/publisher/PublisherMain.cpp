#include <cxxopts.hpp>

#include "Connector.hpp"
#include "DeliveryErrors.hpp"
#include "DeliverySimulator.hpp"
#include "FrameEncoder.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "MessageSource.hpp"
#include "PublisherSession.hpp"
#include "RandomSource.hpp"
#include "SimpleIni.h"
#include "TcpSocketHandler.hpp"

using namespace fj;

namespace {
template <class T, class DefaultT>
T extractSingleOptionWithDefault(const cxxopts::ParseResult& result,
                                 const cxxopts::Options& options,
                                 const string& name, DefaultT defaultValue) {
  auto count = result.count(name);
  if (count == 0) {
    return defaultValue;
  }
  if (count == 1) {
    return result[name].as<T>();
  }
  CLOG(INFO, "stdout") << "Value for " << name
                       << " must be specified only once\n";
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

// Settings that may come from the config file, before CLI overrides
struct PublisherSettings {
  string host = DEFAULT_PUBLISH_HOST;
  int port = DEFAULT_PUBLISH_PORT;
  int64_t reconnectMs = 1000;
  string delimiter = "none";
  int64_t minChunk = 1;
  int64_t maxChunk = 16;
  int64_t jitterMs = 5;
  bool hasSeed = false;
  uint64_t seed = 0;
  string maxlogsize = "20971520";
};

void loadConfigFile(const string& cfgfilename, PublisherSettings* settings,
                    el::Configurations* defaultConf) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(cfgfilename.c_str());
  if (rc < 0) {
    STFATAL << "Invalid config file: " << cfgfilename;
  }

  const char* host = ini.GetValue("Networking", "host", NULL);
  if (host) {
    settings->host = string(host);
  }
  settings->port =
      int(ini.GetLongValue("Networking", "port", settings->port));
  settings->reconnectMs =
      ini.GetLongValue("Networking", "reconnect_ms", settings->reconnectMs);

  const char* delimiter = ini.GetValue("Delivery", "delimiter", NULL);
  if (delimiter) {
    settings->delimiter = string(delimiter);
  }
  settings->minChunk =
      ini.GetLongValue("Delivery", "min_chunk", settings->minChunk);
  settings->maxChunk =
      ini.GetLongValue("Delivery", "max_chunk", settings->maxChunk);
  settings->jitterMs =
      ini.GetLongValue("Delivery", "jitter_ms", settings->jitterMs);
  const char* seed = ini.GetValue("Delivery", "seed", NULL);
  if (seed) {
    settings->hasSeed = true;
    settings->seed = stoull(seed);
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    el::Loggers::setVerboseLevel(atoi(vlevel));
  }
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent && atoi(silent) != 0) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxlogsize is a string of int value
    settings->maxlogsize = to_string(atoi(logsize));
  }
}
}  // namespace

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  fj::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, fj::InterruptSignalHandler);

  cxxopts::Options options(
      "fjpub",
      "Interactive TCP JSON publisher that reproduces frame reassembly edge "
      "cases");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Receiver host name",
         cxxopts::value<std::string>())  //
        ("p,port", "Receiver port", cxxopts::value<int>())  //
        ("delimiter", "Frame terminator: none or newline",
         cxxopts::value<std::string>())  //
        ("min-chunk", "Minimum number of fragments for FragmentedFrame",
         cxxopts::value<int64_t>())  //
        ("max-chunk", "Maximum number of fragments for FragmentedFrame",
         cxxopts::value<int64_t>())  //
        ("jitter-ms", "Upper bound of the pause between fragments (ms)",
         cxxopts::value<int64_t>())  //
        ("seed", "Seed for reproducible chunking/jitter/truncation",
         cxxopts::value<uint64_t>())  //
        ("reconnect-ms", "Delay between connection attempts (ms)",
         cxxopts::value<int64_t>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout")                  //
        ("silent", "Disable logging")                           //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "fjpub version " << FJ_VERSION << endl;
      exit(0);
    }

    PublisherSettings settings;
    if (result.count("cfgfile")) {
      loadConfigFile(result["cfgfile"].as<string>(), &settings, &defaultConf);
    }

    // Command line options take priority over the config file
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    }
    if (result.count("silent")) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    settings.host = extractSingleOptionWithDefault<string>(
        result, options, "host", settings.host);
    settings.port = extractSingleOptionWithDefault<int>(result, options,
                                                        "port", settings.port);
    settings.delimiter = extractSingleOptionWithDefault<string>(
        result, options, "delimiter", settings.delimiter);
    settings.minChunk = extractSingleOptionWithDefault<int64_t>(
        result, options, "min-chunk", settings.minChunk);
    settings.maxChunk = extractSingleOptionWithDefault<int64_t>(
        result, options, "max-chunk", settings.maxChunk);
    settings.jitterMs = extractSingleOptionWithDefault<int64_t>(
        result, options, "jitter-ms", settings.jitterMs);
    settings.reconnectMs = extractSingleOptionWithDefault<int64_t>(
        result, options, "reconnect-ms", settings.reconnectMs);
    if (result.count("seed")) {
      settings.hasSeed = true;
      settings.seed = result["seed"].as<uint64_t>();
    }

    DeliveryConfig config;
    config.minChunk = settings.minChunk;
    config.maxChunk = settings.maxChunk;
    config.jitterMs = settings.jitterMs;
    config.terminator = parseTerminatorMode(settings.delimiter);
    config.validate();
    if (settings.port <= 0 || settings.port > 65535) {
      throw InvalidArgument("Invalid port: " + to_string(settings.port));
    }
    if (settings.reconnectMs < 0) {
      throw InvalidArgument("reconnect-ms must be >= 0");
    }

    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "fjpub", result.count("logtostdout"),
                              !result.count("logtostdout"),
                              settings.maxlogsize);
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("publisher-main");
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    shared_ptr<RandomSource> rng;
    if (settings.hasSeed) {
      LOG(INFO) << "Using seeded random source: " << settings.seed;
      rng.reset(new SeededRandomSource(settings.seed));
    } else {
      rng.reset(new SodiumRandomSource());
    }

    SocketEndpoint endpoint(settings.host, settings.port);
    shared_ptr<SocketHandler> socketHandler(new TcpSocketHandler());
    shared_ptr<Connector> connector(new RetryingConnector(
        socketHandler, endpoint,
        std::chrono::milliseconds(settings.reconnectMs)));
    shared_ptr<FrameEncoder> encoder(
        new FrameEncoder(shared_ptr<MessageSource>(new RandomMessageSource(rng))));
    shared_ptr<DeliverySimulator> simulator(new DeliverySimulator(encoder, rng));

    LOG(INFO) << "Publishing to " << endpoint << " delimiter="
              << terminatorModeName(config.terminator)
              << " chunks=[" << config.minChunk << "," << config.maxChunk
              << "] jitter_ms=" << config.jitterMs;

    PublisherSession session(socketHandler, connector, simulator, rng, config);
    PublisherSession::printBanner();
    session.run(cin);
  } catch (const cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::invalid_argument& e) {
    CLOG(INFO, "stdout") << "Invalid option: " << e.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}

#include <cxxopts.hpp>

#include "CommandDispatcher.hpp"
#include "HostConfig.hpp"
#include "LogHandler.hpp"
#include "PosixPtySystem.hpp"
#include "SessionManager.hpp"
#include "StdioEventSink.hpp"

using namespace ptymux;

namespace {
// Upper bound on how long shutdown waits for session workers to drain.
const std::chrono::milliseconds WORKER_SHUTDOWN_TIMEOUT(5000);
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ptymux::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, ptymux::InterruptSignalHandler);
  // A vanished host must surface as a failed write, not kill us.
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options(
      "ptymux-host",
      "Terminal session host speaking JSON lines on stdin/stdout");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(GetTempDirectory() +
                                                      "ptymux"))  //
        ("shell", "Shell to start instead of $SHELL",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "ptymux-host version " << PTYMUX_VERSION << endl;
      exit(0);
    }

    HostConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    try {
      if (!cfgfilename.empty()) {
        config = HostConfigLoader::loadFile(cfgfilename);
      } else if (fs::exists(HostConfigLoader::defaultPath())) {
        config = HostConfigLoader::loadFile(HostConfigLoader::defaultPath());
      }
    } catch (const std::runtime_error &re) {
      CLOG(ERROR, "stdout") << re.what() << endl;
      exit(1);
    }

    // read verbose level (prioritize command line option over cfgfile)
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else {
      el::Loggers::setVerboseLevel(config.verbose);
    }
    if (result.count("shell")) {
      config.shell = result["shell"].as<string>();
    }

    string logFile = LogHandler::setupLogFile(
        &defaultConf, result["logdir"].as<string>(), "ptymux-host",
        config.maxLogSize);
    if (config.silent) {
      LogHandler::disableLogging(&defaultConf);
    }
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("ptymux-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
    // Redirect std streams to a file
    LogHandler::stderrToFile(result["logdir"].as<string>(), "ptymux-host");

    LOG(INFO) << "ptymux-host " << PTYMUX_VERSION << " starting, logging to "
              << logFile;

    shared_ptr<JsonLineWriter> output(new JsonLineWriter(STDOUT_FILENO));
    shared_ptr<EventSink> eventSink(new StdioEventSink(output));
    shared_ptr<SessionRegistry> registry(new SessionRegistry());
    shared_ptr<PtySystem> ptySystem(new PosixPtySystem());

    SessionManagerOptions managerOptions;
    managerOptions.output = config.output;
    managerOptions.shellOverride = config.shell;
    shared_ptr<SessionManager> sessionManager(
        new SessionManager(ptySystem, registry, eventSink, managerOptions));
    CommandDispatcher dispatcher(sessionManager);

    string line;
    while (std::getline(std::cin, line)) {
      if (trim(line).empty()) {
        continue;
      }
      json response = dispatcher.handleLine(line);
      try {
        output->writeLine(response);
      } catch (const std::exception &ex) {
        LOG(ERROR) << "Host output closed: " << ex.what();
        break;
      }
    }

    LOG(INFO) << "Input closed, shutting down " << sessionManager->numSessions()
              << " sessions";
    sessionManager->forceKill(nullopt);
    if (!sessionManager->waitForWorkers(WORKER_SHUTDOWN_TIMEOUT)) {
      LOG(WARNING) << "Some session workers did not finish in time";
    }
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}

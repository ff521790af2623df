#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace ptymux;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      ptymux::LogHandler::setupLogHandler(&argc, &argv);
  ptymux::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  ptymux::HandleTerminate();

  // Writes to a closed pipe must fail instead of killing the runner.
  ::signal(SIGPIPE, SIG_IGN);

  string logDirectoryPattern =
      GetTempDirectory() + string("ptymux_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  ptymux::LogHandler::setupLogFile(&defaultConf, logDirectory, "log");

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  fs::remove_all(logDirectory);
  return result;
}

#ifndef __PTYMUX_LOG_HANDLER__
#define __PTYMUX_LOG_HANDLER__

#include "Headers.hpp"

namespace ptymux {
/**
 * @brief Configures easylogging++ for the host binary and the test runner.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging++ and returns the base configuration.
   *
   * The returned configuration is not applied yet; callers adjust it (log
   * files, stdout) and then reconfigure the "default" logger.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh file inside `directory`.
   * @param filenamePrefix Prefix of the file, a timestamp and the pid are
   * appended.
   * @return Full path of the created log file.
   */
  static string setupLogFile(el::Configurations *defaultConf,
                             const string &directory,
                             const string &filenamePrefix,
                             const string &maxLogSize = "20971520");

  /** @brief Turns every logger off (the `silent` config option). */
  static void disableLogging(el::Configurations *defaultConf);

  /** @brief Removes a rolled-over log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Configures the "stdout" logger used for user-facing CLI output.
   *
   * Only the message is printed. The host uses it before it starts serving,
   * once stdout carries events it must stay quiet.
   */
  static void setupStdoutLogger();

  /** @brief Redirects the process' stderr into a file in `directory`. */
  static void stderrToFile(const string &directory, const string &prefix);

 private:
  static string timestampedName(const string &prefix);
  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace ptymux
#endif  // __PTYMUX_LOG_HANDLER__

#ifndef __FJ_LOG_HANDLER__
#define __FJ_LOG_HANDLER__

#include "Headers.hpp"

namespace fj {
/**
 * @brief easylogging++ setup shared by fjpub and the test runner.
 *
 * The "default" logger carries diagnostics to a log file.  The "stdout"
 * logger carries the `[publisher]` lines the operator reads.
 */
class LogHandler {
 public:
  /** @brief Starts easylogging and returns the base format configuration. */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points `defaultConf` at `<path>/<prefix>-<time>_<pid>.log`.
   *
   * With `redirectStderrToFile`, stderr goes to a sibling
   * `<prefix>-stderr-...` file.  User-facing output must use the stdout
   * logger in that case.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /** @brief Pre-rollout callback: drops the full log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Message-only logger named "stdout". */
  static void setupStdoutLogger();

 private:
  static string logFileSuffix();
  static string createLogFile(const string &path, const string &filename);
  static void stderrToFile(const string &fullFname);
};
}  // namespace fj
#endif  // __FJ_LOG_HANDLER__

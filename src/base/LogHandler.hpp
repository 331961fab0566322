#ifndef __LT_LOG_HANDLER__
#define __LT_LOG_HANDLER__

#include "Headers.hpp"

namespace lt {
/**
 * @brief Configures easylogging++ for the diagnostic log of a tunnel
 * process.
 *
 * Diagnostic logs record what the transport itself is doing and never travel
 * through the tunnel. Application output goes through a LogSink instead.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging with the default line format.
   * @return A configuration the caller may customize before applying it.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file in @p directory.
   *
   * File names have the form `<prefix>-<timestamp>[_<pid>].log`. Files roll
   * over at @p maxLogBytes.
   * @return The path of the created log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &directory,
                              const string &filenamePrefix,
                              bool logToStdout = false, bool appendPid = false,
                              int64_t maxLogBytes = 20 * 1024 * 1024);

  /**
   * @brief Standard process setup shared by the binaries: log files in the
   * temp directory, verbosity, thread name and log rotation.
   */
  static void setupProcessLogging(el::Configurations *defaultConf,
                                  const string &filenamePrefix,
                                  bool logToStdout, int verbose,
                                  const string &threadName);

  /**
   * @brief Log rotation callback, drops the rolled-out file.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger to print bare messages.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace lt
#endif  // __LT_LOG_HANDLER__

#ifndef __IMM_LOG_HANDLER__
#define __IMM_LOG_HANDLER__

#include "Headers.hpp"

namespace imm {
/**
 * @brief Configures easylogging++ for the bridge executables and tests.
 *
 * Either peer may use its stdout as the protocol channel, so the default
 * logger never writes to the console. User-facing text goes through the
 * separate "stdout" logger.
 */
class LogHandler {
 public:
  /** @brief Size at which a log file is rolled over. */
  static const char *MAX_LOG_SIZE;

  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a new `<prefix>-<time>_<pid>.log` file
   * under path, optionally writing stderr to a sibling file.
   * @return Full path of the log file that was created.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool redirectStderrToFile);

  /**
   * @brief Everything a peer executable does once its options are parsed:
   * log files, thread name, rollover and verbosity.
   * @return Full path of the log file.
   */
  static string startPeerLog(el::Configurations *defaultConf,
                             const string &program, const string &path,
                             int debugLevel, bool redirectStderrToFile);

  /** @brief Undoes the rollover hook installed by startPeerLog. */
  static void stopPeerLog();

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

  /**
   * @brief Maps the `--verbose` level (0 to 9) to easylogging verbosity.
   */
  static void setDebugLevel(int level);

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  /**
   * @brief Ensures the directory exists and creates a new, empty file that
   * nobody else can have opened.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace imm
#endif  // __IMM_LOG_HANDLER__

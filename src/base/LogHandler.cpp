#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace imm {
const char *LogHandler::MAX_LOG_SIZE = "20971520";

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from --verbose through setDebugLevel, not from the
  // easylogging command line arguments
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const string &path,
                                 const string &filenamePrefix,
                                 bool redirectStderrToFile) {
  char timestamp[80];
  time_t now = time(NULL);
  strftime(timestamp, sizeof(timestamp), "%Y-%m-%d_%H-%M-%S", localtime(&now));
  // Both peers of a session usually log into the same directory at the same
  // second
  string suffix = string(timestamp) + "_" + to_string(::getpid()) + ".log";

  string logFile = createLogFile(path, filenamePrefix + "-" + suffix);
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logFile);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           MAX_LOG_SIZE);

  if (redirectStderrToFile) {
    stderrToFile(path, filenamePrefix + "-stderr-" + suffix);
  }
  return logFile;
}

string LogHandler::startPeerLog(el::Configurations *defaultConf,
                                const string &program, const string &path,
                                int debugLevel, bool redirectStderrToFile) {
  string logFile =
      setupLogFiles(defaultConf, path, program, redirectStderrToFile);
  el::Loggers::reconfigureLogger("default", *defaultConf);
  el::Helpers::setThreadName(program + "-main");
  el::Helpers::installPreRollOutCallback(rolloutHandler);
  setDebugLevel(debugLevel);
  LOG(INFO) << program << " " << IMM_VERSION << " started, pid "
            << ::getpid();
  return logFile;
}

void LogHandler::stopPeerLog() { el::Helpers::uninstallPreRollOutCallback(); }

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // SHOULD NOT LOG ANYTHING HERE BECAUSE LOG FILE IS CLOSED!
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

void LogHandler::setDebugLevel(int level) {
  el::Loggers::setVerboseLevel(std::max(0, std::min(level, 9)));
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory: " << fse.what()
                          << endl;
    exit(1);
  }
  string fullPath = path + "/" + filename;
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullPath;
}

void LogHandler::stderrToFile(const string &path,
                              const string &stderrFilename) {
  string fullPath = createLogFile(path, stderrFilename);
  FILE *stderrStream = freopen(fullPath.c_str(), "w", stderr);
  if (!stderrStream) {
    STFATAL << "Invalid filename " << stderrFilename;
  }
  setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);  // set to line buffering
}
}  // namespace imm

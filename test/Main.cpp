#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace imm;

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
      imm::LogHandler::setupLogHandler(&argc, &argv);
  imm::LogHandler::setupStdoutLogger();
  // imm::LogHandler::setDebugLevel(9);

  imm::HandleTerminate();
  if (sodium_init() == -1) {
    cerr << "libsodium init failed" << endl;
    return 1;
  }
  // Tests close pipes under live writers on purpose
  ::signal(SIGPIPE, SIG_IGN);

  string logDirectoryPattern = GetTempDirectory() + string("imm_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  // Peer threads in the tests log through the same file
  imm::LogHandler::startPeerLog(&defaultConf, "imm-test", logDirectory, 0,
                                true);

  int result = Catch::Session().run(argc, argv);

  imm::LogHandler::stopPeerLog();
  fs::remove_all(logDirectory);
  return result;
}

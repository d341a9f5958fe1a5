#include <cxxopts.hpp>

#include "Communicator.hpp"
#include "LogHandler.hpp"

using namespace imm;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  imm::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, imm::InterruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options(
      "imm-forward",
      "Prints a communicator descriptor line, then copies everything the "
      "process sends through it to stdout");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("mode", "unnamed-pipe or multiprocessing-network",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(GetTempDirectory() +
                                                      "imm"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "imm-forward version " << IMM_VERSION << endl;
      exit(0);
    }

    LogHandler::startPeerLog(&defaultConf, "imm-forward",
                             result["logdir"].as<string>(),
                             result["verbose"].as<int>(), false);

    string mode = result["mode"].as<string>();
    if (mode.empty()) {
      mode = UnnamedPipeCommunicator::isAvailable() ? "unnamed-pipe"
                                                    : "multiprocessing-network";
    }

    shared_ptr<TcpSocketHandler> socketHandler(new TcpSocketHandler());
    socketHandler->adopt(STDOUT_FILENO);
    if (mode == "unnamed-pipe") {
      if (!UnnamedPipeCommunicator::isAvailable()) {
        cerr << "imm-forward: unnamed pipes need /proc" << endl;
        exit(1);
      }
      UnnamedPipeCommunicator::forward(socketHandler, STDOUT_FILENO);
    } else if (mode == "multiprocessing-network") {
      NetworkCommunicator::forward(socketHandler, STDOUT_FILENO);
    } else {
      CLOG(INFO, "stdout") << "Unknown mode: " << mode << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    LOG(ERROR) << "Forwarding failed: " << re.what();
    cerr << "imm-forward: " << re.what() << endl;
    return 1;
  }
  LogHandler::stopPeerLog();
  return 0;
}

#include <cxxopts.hpp>

#include "Communicator.hpp"
#include "HostHandlers.hpp"
#include "LogHandler.hpp"
#include "ProcessDispatcher.hpp"

using namespace imm;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  imm::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, imm::InterruptSignalHandler);
  // A vanished engine shows up as a write error instead
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("imm-host",
                           "Process side of the engine bridge. Reads the "
                           "identity line on stdin, then serves the engine.");
  int exitCode = 0;
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("timeout", "Bound on every read from the engine in ms, 0 for none",
         cxxopts::value<int64_t>())  //
        ("sanity-check-extra-line",
         "Fail if the engine sends anything after ending the session")  //
        ("debug-log-communication",
         "Append every protocol line to this file ($pid is replaced)",
         cxxopts::value<std::string>())  //
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
      CLOG(INFO, "stdout") << "imm-host version " << IMM_VERSION << endl;
      exit(0);
    }

    SessionConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty() && !config.loadIniFile(cfgfilename)) {
      STFATAL << "Invalid config file: " << cfgfilename;
    }
    // Command line wins over the config file
    if (result.count("timeout")) {
      config.timeoutMs = result["timeout"].as<int64_t>();
    }
    if (result.count("sanity-check-extra-line")) {
      config.sanityCheckExtraLine = true;
    }
    if (result.count("debug-log-communication")) {
      config.communicationLogPath =
          result["debug-log-communication"].as<string>();
    }
    if (result.count("verbose")) {
      config.debugLevel = result["verbose"].as<int>();
    }

    // stdout may be the channel to the engine, so logs only go to files
    LogHandler::startPeerLog(&defaultConf, "imm-host",
                             result["logdir"].as<string>(), config.debugLevel,
                             true);

    shared_ptr<TcpSocketHandler> socketHandler(new TcpSocketHandler());
    socketHandler->adopt(STDIN_FILENO);
    socketHandler->adopt(STDOUT_FILENO);
    shared_ptr<Channel> channel(
        new Channel(socketHandler, STDIN_FILENO, STDOUT_FILENO));
    shared_ptr<Session> session(
        new Session(Session::PROCESS, channel, config));
    session->acceptIdentity();

    if (!session->getConfig().communicator.empty()) {
      try {
        shared_ptr<Communicator> communicator = createCommunicator(
            session->getConfig().communicator, socketHandler);
        channel->setWriteFd(communicator->open());
      } catch (const std::exception &e) {
        session->fail();
        LOG(ERROR) << "Cannot reach the engine through '"
                   << session->getConfig().communicator << "': " << e.what();
        cerr << "imm-host: cannot reach the engine: " << e.what() << endl;
        LogHandler::stopPeerLog();
        return 1;
      }
    }

    if (session->getConfig().driver != SessionConfig::ENGINE) {
      LOG(ERROR) << "imm-host only serves engine-driven sessions";
      cerr << "imm-host: the engine must drive the session" << endl;
      exit(1);
    }

    shared_ptr<HandlerTable> handlers(new HandlerTable());
    registerHostHandlers(handlers.get());
    ProcessDispatcher dispatcher(session, handlers);
    dispatcher.serve();
    LOG(INFO) << "Engine ended the session";
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const ProtocolError &pe) {
    LOG(ERROR) << "Session aborted: " << pe.what();
    cerr << "imm-host: " << pe.what() << endl;
    exitCode = 1;
  } catch (const DecodeError &de) {
    LOG(ERROR) << "Session aborted: " << de.what();
    cerr << "imm-host: " << de.what() << endl;
    exitCode = 1;
  }

  LogHandler::stopPeerLog();
  return exitCode;
}

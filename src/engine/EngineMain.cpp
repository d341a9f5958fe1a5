#include <cxxopts.hpp>

#include "EngineDispatcher.hpp"
#include "EngineHandlers.hpp"
#include "LogHandler.hpp"
#include "SubprocessUtils.hpp"
#include "UnixSocketHandler.hpp"

using namespace imm;

namespace {
/**
 * Runs every `handler argument` line of the script against the Process and
 * prints the results. Returns false if a call failed.
 */
bool runScript(EngineDispatcher *dispatcher, const string &scriptPath) {
  ifstream script(scriptPath);
  if (!script.is_open()) {
    throw std::runtime_error("Could not open script " + scriptPath);
  }
  bool ok = true;
  string line;
  while (getline(script, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    size_t space = line.find(' ');
    string name = line.substr(0, space);
    string argument = space == string::npos ? "" : line.substr(space + 1);
    try {
      string value = dispatcher->invokeRemote(name, Argument::text(argument));
      CLOG(INFO, "stdout") << name << " " << argument << " -> " << value;
    } catch (const RemoteFailure &rf) {
      CLOG(INFO, "stdout") << name << " " << argument
                           << " failed: " << rf.getSummary();
      ok = false;
      if (dispatcher->getSession()->getStatus() != Session::RUNNING) {
        break;
      }
    } catch (const std::invalid_argument &ia) {
      CLOG(INFO, "stdout") << name << ": " << ia.what();
      ok = false;
    }
  }
  return ok;
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  imm::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, imm::InterruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("imm-engine",
                           "Reference engine peer of the bridge");
  int exitCode = 0;
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("mark", "Engine mark to announce (p, x or l)",
         cxxopts::value<std::string>()->default_value("p"))  //
        ("listen",
         "Let the process on the other end of stdin/stdout drive")  //
        ("script", "Run the calls in this file against a spawned host",
         cxxopts::value<std::string>())  //
        ("host", "Host executable to spawn in script mode",
         cxxopts::value<std::string>()->default_value("imm-host"))  //
        ("host-arg", "Extra argument for the host (repeatable)",
         cxxopts::value<std::vector<std::string>>())  //
        ("naive-flush", "Pad every message with a flush line")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
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
      CLOG(INFO, "stdout") << "imm-engine version " << IMM_VERSION << endl;
      exit(0);
    }
    if (result.count("listen") == result.count("script")) {
      CLOG(INFO, "stdout") << "Pass exactly one of --listen and --script"
                           << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    SessionConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty() && !config.loadIniFile(cfgfilename)) {
      STFATAL << "Invalid config file: " << cfgfilename;
    }
    string mark = result["mark"].as<string>();
    if (mark.length() != 1 || Handshake::findProfile(mark[0]) == NULL) {
      CLOG(INFO, "stdout") << "Unknown engine mark: " << mark << endl;
      exit(1);
    }
    config.engineMark = mark[0];
    if (result.count("naive-flush")) {
      config.naiveFlush = true;
    }
    if (result.count("debug-log-communication")) {
      config.communicationLogPath =
          result["debug-log-communication"].as<string>();
    }
    if (result.count("verbose")) {
      config.debugLevel = result["verbose"].as<int>();
    }

    LogHandler::startPeerLog(&defaultConf, "imm-engine",
                             result["logdir"].as<string>(), config.debugLevel,
                             false);

    shared_ptr<HandlerTable> handlers(new HandlerTable());
    registerEngineHandlers(handlers.get());
    shared_ptr<UnixSocketHandler> socketHandler(new UnixSocketHandler());

    if (result.count("listen")) {
      config.driver = SessionConfig::PROCESS;
      socketHandler->adopt(STDIN_FILENO);
      socketHandler->adopt(STDOUT_FILENO);
      shared_ptr<Channel> channel(
          new Channel(socketHandler, STDIN_FILENO, STDOUT_FILENO));
      shared_ptr<Session> session(
          new Session(Session::ENGINE, channel, config));
      EngineDispatcher dispatcher(session, handlers);
      dispatcher.start();
      dispatcher.listen();
    } else {
      config.driver = SessionConfig::ENGINE;
      vector<string> hostArgs;
      if (result.count("host-arg")) {
        hostArgs = result["host-arg"].as<vector<string>>();
      }
      SubprocessUtils subprocessUtils;
      ChildProcess host =
          subprocessUtils.spawn(result["host"].as<string>(), hostArgs);
      socketHandler->adopt(host.fromChildFd);
      socketHandler->adopt(host.toChildFd);
      shared_ptr<Channel> channel(
          new Channel(socketHandler, host.fromChildFd, host.toChildFd));
      shared_ptr<Session> session(
          new Session(Session::ENGINE, channel, config));
      EngineDispatcher dispatcher(session, handlers);
      dispatcher.start();
      bool ok = runScript(&dispatcher, result["script"].as<string>());
      if (session->getStatus() == Session::RUNNING) {
        dispatcher.finish();
      }
      channel->closeRead();
      int hostStatus = subprocessUtils.waitForExit(host.pid);
      LOG(INFO) << "Host exited with " << hostStatus;
      exitCode = (ok && hostStatus == 0) ? 0 : 1;
    }
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const ProtocolError &pe) {
    LOG(ERROR) << "Session aborted: " << pe.what();
    cerr << "imm-engine: " << pe.what() << endl;
    exitCode = 1;
  } catch (const DecodeError &de) {
    LOG(ERROR) << "Session aborted: " << de.what();
    cerr << "imm-engine: " << de.what() << endl;
    exitCode = 1;
  }

  LogHandler::stopPeerLog();
  return exitCode;
}

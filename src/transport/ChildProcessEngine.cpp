#include "ChildProcessEngine.hpp"

namespace imm {
ChildProcessEngine::ChildProcessEngine(const string& _enginePath,
                                       const vector<string>& _args,
                                       const SessionConfig& _config,
                                       shared_ptr<HandlerTable> _handlers)
    : enginePath(_enginePath),
      args(_args),
      config(_config),
      handlers(_handlers),
      socketHandler(new UnixSocketHandler()),
      reaped(false),
      exitStatus(-1) {}

ChildProcessEngine::~ChildProcessEngine() {
  if (child.pid > 0 && !reaped) {
    LOG(WARNING) << "Engine " << child.pid << " still running, terminating it";
    ::kill(child.pid, SIGTERM);
    subprocessUtils.waitForExit(child.pid);
  }
}

void ChildProcessEngine::start() {
  if (child.pid > 0) {
    throw std::logic_error("Engine already started");
  }
  child = subprocessUtils.spawn(enginePath, args);
  socketHandler->adopt(child.fromChildFd);
  socketHandler->adopt(child.toChildFd);
  channel.reset(new Channel(socketHandler, child.fromChildFd, child.toChildFd));
  session.reset(new Session(Session::PROCESS, channel, config));
  session->addOnClose([this]() { channel->closeRead(); });
  dispatcher.reset(new ProcessDispatcher(session, handlers));

  session->acceptIdentity();
  if (session->getConfig().driver != SessionConfig::PROCESS) {
    session->fail();
    throw ProtocolError(ProtocolError::HANDSHAKE_EXPECTED,
                        "child engine expects to drive the session");
  }
  LOG(INFO) << "Started engine " << enginePath << " as pid " << child.pid
            << " (mark " << session->getEngineMark() << ")";
}

int ChildProcessEngine::close() {
  if (child.pid <= 0 || reaped) {
    return exitStatus;
  }
  if (session->getStatus() == Session::RUNNING) {
    dispatcher->finish();
  } else {
    session->close();
  }
  exitStatus = subprocessUtils.waitForExit(child.pid);
  reaped = true;
  VLOG(1) << "Engine " << child.pid << " exited with " << exitStatus;
  return exitStatus;
}
}  // namespace imm

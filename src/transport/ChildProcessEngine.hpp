#ifndef __IMM_CHILD_PROCESS_ENGINE__
#define __IMM_CHILD_PROCESS_ENGINE__

#include "ProcessDispatcher.hpp"
#include "SubprocessUtils.hpp"
#include "UnixSocketHandler.hpp"

namespace imm {
/**
 * @brief Runs an Engine executable as a child process and drives it from
 * this Process over its stdin/stdout.
 *
 * The child must announce itself with a Process-driven identity line.
 */
class ChildProcessEngine {
 public:
  ChildProcessEngine(const string& _enginePath, const vector<string>& _args,
                     const SessionConfig& _config,
                     shared_ptr<HandlerTable> _handlers);
  ~ChildProcessEngine();

  /**
   * @brief Spawns the engine and completes the handshake.
   */
  void start();

  /** @brief Shortcut for getDispatcher()->invokeRemote(). */
  string invoke(const string& handlerName, const Argument& argument) {
    return dispatcher->invokeRemote(handlerName, argument);
  }

  /**
   * @brief Ends the session if it is still running, waits for the child and
   * returns its exit status.
   */
  int close();

  shared_ptr<ProcessDispatcher> getDispatcher() { return dispatcher; }
  shared_ptr<Session> getSession() { return session; }
  pid_t getPid() const { return child.pid; }

 protected:
  string enginePath;
  vector<string> args;
  SessionConfig config;
  shared_ptr<HandlerTable> handlers;
  shared_ptr<UnixSocketHandler> socketHandler;
  SubprocessUtils subprocessUtils;
  ChildProcess child;
  shared_ptr<Channel> channel;
  shared_ptr<Session> session;
  shared_ptr<ProcessDispatcher> dispatcher;
  bool reaped;
  int exitStatus;
};
}  // namespace imm

#endif  // __IMM_CHILD_PROCESS_ENGINE__

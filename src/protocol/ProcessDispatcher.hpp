#ifndef __IMM_PROCESS_DISPATCHER__
#define __IMM_PROCESS_DISPATCHER__

#include "Dispatcher.hpp"

namespace imm {
/**
 * @brief Dispatcher of the Process side. Every read is bounded by the
 * session timeout.
 */
class ProcessDispatcher : public Dispatcher {
 public:
  ProcessDispatcher(shared_ptr<Session> _session,
                    shared_ptr<HandlerTable> _handlers);

  virtual string invokeRemote(const string& handlerName,
                              const Argument& argument);

  /**
   * @brief Serves an Engine-driven session: sends the bootstrap block with
   * the local handler names, then runs every call the Engine makes until it
   * ends the session.
   */
  void serve();

  /**
   * @brief Ends a Process-driven session.
   */
  void finish();
};
}  // namespace imm

#endif  // __IMM_PROCESS_DISPATCHER__

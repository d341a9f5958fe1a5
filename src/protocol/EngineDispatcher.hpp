#ifndef __IMM_ENGINE_DISPATCHER__
#define __IMM_ENGINE_DISPATCHER__

#include "Dispatcher.hpp"

namespace imm {
/**
 * @brief Result of one runOneTriggeredCall().
 */
struct TriggerOutcome {
  enum Kind {
    /** A call from the Process ran to completion here. */
    HANDLED,
    /** The innermost call into the Process returned. */
    RETURNED,
    /** The innermost call into the Process failed. */
    FAILED,
    /** The Process ended the session. */
    FINISHED,
  };

  Kind kind = HANDLED;
  /** Return value, or the failure summary. */
  string value;
  vector<string> trace;
};

/**
 * @brief Dispatcher of the Engine side.
 *
 * The Engine has no event loop: it only reacts to the Process at the points
 * where it explicitly calls runOneTriggeredCall(). invokeRemote() is a send
 * followed by such calls until its own return arrives.
 */
class EngineDispatcher : public Dispatcher {
 public:
  EngineDispatcher(shared_ptr<Session> _session,
                   shared_ptr<HandlerTable> _handlers);

  /**
   * @brief Announces the engine. When the Engine drives, also reads the
   * bootstrap block naming the Process handlers.
   */
  void start();

  /**
   * @brief Reads exactly one message and acts on it. Reads are never bounded.
   */
  TriggerOutcome runOneTriggeredCall();

  /**
   * @brief Throws std::invalid_argument for a handler the Process did not
   * list in its bootstrap block.
   */
  virtual string invokeRemote(const string& handlerName,
                              const Argument& argument);

  /**
   * @brief Serves a Process-driven session until the Process ends it.
   */
  void listen();

  /**
   * @brief Ends an Engine-driven session.
   */
  void finish();

  const set<string>& getRemoteHandlerNames() const { return remoteNames; }

 protected:
  set<string> remoteNames;
  bool bootstrapped;
};
}  // namespace imm

#endif  // __IMM_ENGINE_DISPATCHER__

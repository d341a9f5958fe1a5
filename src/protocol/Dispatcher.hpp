#ifndef __IMM_DISPATCHER__
#define __IMM_DISPATCHER__

#include "CallFrame.hpp"
#include "Handler.hpp"
#include "Session.hpp"

namespace imm {
/**
 * @brief Nested call/return state machine shared by both sides.
 *
 * Wire messages, one per send:
 *  - `i<name>` followed by the argument the named handler expects,
 *  - `r<value>`, the return of the innermost open call,
 *  - `e<summary>` followed by a block holding the failure trace.
 *
 * Every call in flight on this side is a CallFrame. LOCAL frames are
 * handlers running here; REMOTE frames are calls waiting for the peer.
 */
class Dispatcher {
 public:
  Dispatcher(shared_ptr<Session> _session, shared_ptr<HandlerTable> _handlers);
  virtual ~Dispatcher() {}

  /**
   * @brief Runs a handler on the peer and returns its value.
   *
   * Calls the peer makes back into this side while the handler runs are
   * dispatched to local handlers before this returns. Throws RemoteFailure
   * when the handler failed, ProtocolError when the peers lost sync.
   */
  virtual string invokeRemote(const string& handlerName,
                              const Argument& argument) = 0;

  /**
   * @brief Sends the return message of the innermost local handler and pops
   * its frame. Handlers normally just return their value; calling this
   * directly ends the handler's part in the exchange early.
   *
   * Throws ProtocolError NO_OPEN_FRAME when no local handler is open.
   */
  void returnToCaller(const string& value);

  const vector<CallFrame>& getFrames() const { return frames; }
  size_t getDepth() const { return frames.size(); }

  /** @brief The open frames as `handler@side`, innermost first. */
  string describeCallSite() const;

  shared_ptr<Session> getSession() { return session; }
  shared_ptr<HandlerTable> getHandlers() { return handlers; }

 protected:
  struct Message {
    enum Kind {
      INVOKE,
      RETURN,
      FAILURE,
    };
    Kind kind;
    string body;
  };

  /**
   * @brief Reads the first line of the next message. Returns false on end
   * of stream.
   */
  bool readMessage(Message* message);

  /** @brief Sends an invoke and pushes its REMOTE frame. */
  void sendInvoke(const string& handlerName, const Argument& argument);

  /**
   * @brief Runs a handler the peer invoked, then sends its return or its
   * failure.
   */
  void dispatchLocal(const string& handlerName);

  Argument readArgument(ArgumentKind kind);

  void sendFailure(const string& summary, const vector<string>& trace);

  /**
   * @brief Reads the trace of a failure message and pops the REMOTE frame it
   * answers.
   */
  RemoteFailure receiveFailure(const string& summary);

  void popRemoteFrame();

  string frameLabel(const CallFrame& frame) const;

  /**
   * @brief Fails the session and builds the error to throw.
   */
  ProtocolError fatal(ProtocolError::Kind kind, const string& message);

  shared_ptr<Session> session;
  shared_ptr<HandlerTable> handlers;
  vector<CallFrame> frames;
  /**
   * Depth of the local handler that received a failure which already
   * crossed more than one level, or 0. That handler may not recover from it.
   */
  size_t crossLevelFailureDepth;
  vector<string> crossLevelTrace;
};
}  // namespace imm

#endif  // __IMM_DISPATCHER__

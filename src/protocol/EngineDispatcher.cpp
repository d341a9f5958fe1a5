#include "EngineDispatcher.hpp"

namespace imm {
EngineDispatcher::EngineDispatcher(shared_ptr<Session> _session,
                                   shared_ptr<HandlerTable> _handlers)
    : Dispatcher(_session, _handlers), bootstrapped(false) {
  if (session->getSide() != Session::ENGINE) {
    throw std::invalid_argument("EngineDispatcher needs an engine session");
  }
}

void EngineDispatcher::start() {
  session->announce();
  if (session->getConfig().driver == SessionConfig::ENGINE) {
    vector<string> names = session->readBlock();
    remoteNames = set<string>(names.begin(), names.end());
    bootstrapped = true;
    VLOG(1) << "Process offers " << remoteNames.size() << " handlers";
  }
}

TriggerOutcome EngineDispatcher::runOneTriggeredCall() {
  TriggerOutcome outcome;
  Message message;
  if (!readMessage(&message)) {
    throw fatal(ProtocolError::CHANNEL_CLOSED,
                "process closed the channel without ending the session");
  }
  switch (message.kind) {
    case Message::INVOKE:
      dispatchLocal(message.body);
      outcome.kind = TriggerOutcome::HANDLED;
      break;
    case Message::RETURN:
      if (frames.empty()) {
        VLOG(1) << "Process ended the session";
        outcome.kind = TriggerOutcome::FINISHED;
      } else {
        popRemoteFrame();
        outcome.kind = TriggerOutcome::RETURNED;
        outcome.value = message.body;
      }
      break;
    case Message::FAILURE: {
      if (frames.empty()) {
        throw fatal(ProtocolError::UNEXPECTED_MESSAGE_KIND,
                    "failure reported with no call in flight: " +
                        message.body);
      }
      RemoteFailure failure = receiveFailure(message.body);
      outcome.kind = TriggerOutcome::FAILED;
      outcome.value = failure.getSummary();
      outcome.trace = failure.getTrace();
      break;
    }
  }
  return outcome;
}

string EngineDispatcher::invokeRemote(const string& handlerName,
                                      const Argument& argument) {
  if (bootstrapped && remoteNames.find(handlerName) == remoteNames.end()) {
    throw std::invalid_argument("The process has no handler named " +
                                handlerName);
  }
  sendInvoke(handlerName, argument);
  while (true) {
    TriggerOutcome outcome = runOneTriggeredCall();
    switch (outcome.kind) {
      case TriggerOutcome::HANDLED:
        break;
      case TriggerOutcome::RETURNED:
        return outcome.value;
      case TriggerOutcome::FAILED:
        throw RemoteFailure(outcome.value, outcome.trace);
      case TriggerOutcome::FINISHED:
        throw fatal(ProtocolError::UNEXPECTED_MESSAGE_KIND,
                    "process ended the session while " + handlerName +
                        " was running");
    }
  }
}

void EngineDispatcher::listen() {
  if (session->getConfig().driver != SessionConfig::PROCESS) {
    throw std::logic_error("listen() is for sessions the process drives");
  }
  while (true) {
    TriggerOutcome outcome = runOneTriggeredCall();
    if (outcome.kind == TriggerOutcome::FINISHED) {
      break;
    }
  }
  session->close();
}

void EngineDispatcher::finish() {
  if (!frames.empty()) {
    throw std::logic_error("finish() called with calls in flight");
  }
  session->send(vector<string>(1, "r"));
  session->close();
}
}  // namespace imm

#include "ProcessDispatcher.hpp"

namespace imm {
ProcessDispatcher::ProcessDispatcher(shared_ptr<Session> _session,
                                     shared_ptr<HandlerTable> _handlers)
    : Dispatcher(_session, _handlers) {
  if (session->getSide() != Session::PROCESS) {
    throw std::invalid_argument("ProcessDispatcher needs a process session");
  }
}

string ProcessDispatcher::invokeRemote(const string& handlerName,
                                       const Argument& argument) {
  sendInvoke(handlerName, argument);
  while (true) {
    Message message;
    if (!readMessage(&message)) {
      throw fatal(ProtocolError::CHANNEL_CLOSED,
                  "engine closed the channel while " + handlerName +
                      " was running");
    }
    switch (message.kind) {
      case Message::INVOKE:
        dispatchLocal(message.body);
        break;
      case Message::RETURN:
        popRemoteFrame();
        return message.body;
      case Message::FAILURE:
        throw receiveFailure(message.body);
    }
  }
}

void ProcessDispatcher::serve() {
  session->checkUsable();
  if (session->getConfig().driver != SessionConfig::ENGINE) {
    throw std::logic_error("serve() is for sessions the engine drives");
  }
  if (!frames.empty()) {
    throw std::logic_error("serve() called from inside a handler");
  }
  session->send(BlockProtocol::frame(handlers->names()));
  VLOG(1) << "Sent bootstrap block with " << handlers->size() << " handlers";

  while (true) {
    Message message;
    if (!readMessage(&message)) {
      throw fatal(ProtocolError::CHANNEL_CLOSED,
                  "engine closed the channel without ending the session");
    }
    if (message.kind == Message::INVOKE) {
      dispatchLocal(message.body);
    } else if (message.kind == Message::RETURN) {
      VLOG(1) << "Engine ended the session";
      break;
    } else {
      throw fatal(ProtocolError::UNEXPECTED_MESSAGE_KIND,
                  "failure reported with no call in flight: " + message.body);
    }
  }

  if (session->getConfig().sanityCheckExtraLine) {
    string extra;
    if (session->readLine(&extra)) {
      throw fatal(ProtocolError::UNEXPECTED_MESSAGE_KIND,
                  "peer sent extra line: " + extra.substr(0, 64));
    }
  }
  session->close();
}

void ProcessDispatcher::finish() {
  if (!frames.empty()) {
    throw std::logic_error("finish() called with calls in flight");
  }
  session->send(vector<string>(1, "r"));
  session->close();
}
}  // namespace imm

#include "Dispatcher.hpp"

namespace imm {
Dispatcher::Dispatcher(shared_ptr<Session> _session,
                       shared_ptr<HandlerTable> _handlers)
    : session(_session), handlers(_handlers), crossLevelFailureDepth(0) {}

string Dispatcher::frameLabel(const CallFrame& frame) const {
  Session::Side side = frame.direction == CallFrame::LOCAL
                           ? session->getSide()
                           : session->getPeerSide();
  return frame.handlerName + "@" + Session::sideName(side);
}

string Dispatcher::describeCallSite() const {
  string s;
  for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
    if (!s.empty()) {
      s += " < ";
    }
    s += frameLabel(*it);
  }
  return s;
}

ProtocolError Dispatcher::fatal(ProtocolError::Kind kind,
                                const string& message) {
  session->fail();
  return ProtocolError(kind, message, describeCallSite());
}

bool Dispatcher::readMessage(Message* message) {
  string line;
  if (!session->readLine(&line)) {
    return false;
  }
  if (line.empty()) {
    throw fatal(ProtocolError::UNEXPECTED_MESSAGE_KIND,
                "got an empty line where a message was expected");
  }
  switch (line[0]) {
    case 'i':
      message->kind = Message::INVOKE;
      break;
    case 'r':
      message->kind = Message::RETURN;
      break;
    case 'e':
      message->kind = Message::FAILURE;
      break;
    default:
      throw fatal(ProtocolError::UNEXPECTED_MESSAGE_KIND,
                  "got '" + line.substr(0, 64) + "' where a message was expected");
  }
  message->body = line.substr(1);
  VLOG(3) << "Received " << line[0] << " " << message->body;
  return true;
}

void Dispatcher::sendInvoke(const string& handlerName,
                            const Argument& argument) {
  session->checkUsable();
  if (handlerName.empty() || handlerName.find('\n') != string::npos) {
    throw std::invalid_argument("Invalid handler name: '" + handlerName + "'");
  }
  vector<string> lines(1, "i" + handlerName);
  switch (argument.kind) {
    case ArgumentKind::NONE:
      break;
    case ArgumentKind::LINE:
      if (argument.line.find('\n') != string::npos) {
        throw std::invalid_argument(
            "A line argument cannot contain a line break; send a block");
      }
      lines.push_back(argument.line);
      break;
    case ArgumentKind::TOKEN_LIST:
      lines.push_back(session->getCodec().encode(argument.tokens));
      break;
    case ArgumentKind::BLOCK: {
      vector<string> framed = BlockProtocol::frame(argument.block);
      lines.insert(lines.end(), framed.begin(), framed.end());
      break;
    }
  }
  session->send(lines);
  frames.push_back(
      CallFrame(handlerName, CallFrame::REMOTE, int(frames.size()) - 1));
  VLOG(3) << "Invoked " << frameLabel(frames.back()) << " with a "
          << argumentKindName(argument.kind) << " argument, depth "
          << frames.size();
}

Argument Dispatcher::readArgument(ArgumentKind kind) {
  switch (kind) {
    case ArgumentKind::NONE:
      return Argument::none();
    case ArgumentKind::LINE:
    case ArgumentKind::TOKEN_LIST: {
      string line;
      if (!session->readLine(&line)) {
        throw fatal(ProtocolError::CHANNEL_CLOSED,
                    "stream ended before the argument line");
      }
      if (kind == ArgumentKind::LINE) {
        return Argument::text(line);
      }
      try {
        return Argument::tokenList(session->getCodec().decode(line));
      } catch (const DecodeError& e) {
        LOG(ERROR) << "Could not decode token list argument: " << e.what();
        session->fail();
        throw;
      }
    }
    case ArgumentKind::BLOCK:
      return Argument::lines(session->readBlock());
  }
  return Argument::none();
}

void Dispatcher::dispatchLocal(const string& handlerName) {
  shared_ptr<Handler> handler = handlers->find(handlerName);
  if (!handler.get()) {
    LOG(ERROR) << "Peer invoked unknown handler " << handlerName;
    // The argument cannot be skipped without knowing its kind, so the
    // session ends here. Tell the peer why first.
    sendFailure("unknown handler " + handlerName,
                vector<string>(1, handlerName + "@" +
                                      Session::sideName(session->getSide())));
    throw fatal(ProtocolError::UNKNOWN_HANDLER,
                "peer invoked unknown handler " + handlerName);
  }

  Argument argument = readArgument(handler->getArgumentKind());
  frames.push_back(
      CallFrame(handlerName, CallFrame::LOCAL, int(frames.size()) - 1));
  size_t depth = frames.size();
  string label = frameLabel(frames.back());
  VLOG(3) << "Running " << label << ", depth " << depth;

  string value;
  bool failed = false;
  string summary;
  vector<string> trace;
  try {
    value = handler->call(this, argument);
    if (value.find('\n') != string::npos) {
      throw std::invalid_argument("Return value of " + handlerName +
                                  " contains a line break");
    }
  } catch (const ProtocolError&) {
    session->fail();
    throw;
  } catch (const DecodeError&) {
    session->fail();
    throw;
  } catch (const RemoteFailure& e) {
    failed = true;
    summary = e.getSummary();
    trace = e.getTrace();
  } catch (const std::exception& e) {
    failed = true;
    summary = e.what();
  }

  bool caughtCrossLevelFailure = crossLevelFailureDepth == depth;
  if (caughtCrossLevelFailure) {
    crossLevelFailureDepth = 0;
  }
  if (frames.size() != depth) {
    // The handler already returned through returnToCaller
    if (failed || caughtCrossLevelFailure) {
      throw fatal(ProtocolError::NO_OPEN_FRAME,
                  "handler " + handlerName + " failed after returning: " +
                      (failed ? summary : "caught a multi-level failure"));
    }
    return;
  }
  if (caughtCrossLevelFailure && !failed) {
    LOG(ERROR) << "Handler " << label
               << " caught a failure that crossed several levels";
    failed = true;
    summary = "handler " + handlerName +
              " caught a failure from a nested call more than one level deep";
    trace = crossLevelTrace;
  }
  if (failed) {
    frames.pop_back();
    trace.push_back(label);
    LOG(WARNING) << "Handler " << label << " failed: " << summary;
    sendFailure(summary, trace);
    return;
  }
  returnToCaller(value);
}

void Dispatcher::returnToCaller(const string& value) {
  if (frames.empty() || frames.back().direction != CallFrame::LOCAL) {
    throw fatal(ProtocolError::NO_OPEN_FRAME,
                "return of '" + value.substr(0, 64) +
                    "' without an open local handler");
  }
  if (value.find('\n') != string::npos) {
    throw std::invalid_argument("Return values cannot contain a line break");
  }
  session->send(vector<string>(1, "r" + value));
  VLOG(3) << "Returned from " << frameLabel(frames.back()) << ": " << value;
  frames.pop_back();
}

void Dispatcher::sendFailure(const string& summary,
                             const vector<string>& trace) {
  string oneLine = summary;
  replace(oneLine.begin(), oneLine.end(), '\n', ' ');
  vector<string> lines(1, "e" + oneLine);
  vector<string> framed = BlockProtocol::frame(trace);
  lines.insert(lines.end(), framed.begin(), framed.end());
  session->send(lines);
}

void Dispatcher::popRemoteFrame() {
  if (frames.empty() || frames.back().direction != CallFrame::REMOTE) {
    throw fatal(ProtocolError::UNEXPECTED_MESSAGE_KIND,
                "peer answered a call that is not in flight");
  }
  frames.pop_back();
}

RemoteFailure Dispatcher::receiveFailure(const string& summary) {
  vector<string> trace = session->readBlock();
  popRemoteFrame();
  RemoteFailure failure(summary, trace);
  LOG(WARNING) << "Remote failure after " << failure.getLevels()
               << " level(s): " << summary;
  if (failure.getLevels() > 1) {
    // Recovering from a failure that unwound more than one nested call is
    // not supported; the session ends once the outermost caller has it.
    if (frames.empty()) {
      LOG(ERROR) << "Failure crossed " << failure.getLevels()
                 << " nesting levels, ending the session";
      session->fail();
    } else {
      crossLevelFailureDepth = frames.size();
      crossLevelTrace = failure.getTrace();
    }
  }
  return failure;
}
}  // namespace imm

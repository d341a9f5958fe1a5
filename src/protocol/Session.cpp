#include "Session.hpp"

namespace imm {
Session::Session(Side _side, shared_ptr<Channel> _channel,
                 const SessionConfig& _config)
    : side(_side),
      channel(_channel),
      config(_config),
      status(WAITING),
      turn(_side == ENGINE),
      closed(false),
      codec(false) {
  if (sodium_init() == -1) {
    throw std::runtime_error("libsodium init failed");
  }
  if (!config.communicationLogPath.empty()) {
    channel->setCommunicationLog(
        shared_ptr<CommunicationLog>(new CommunicationLog(
            config.communicationLogPath)));
  }
  applyConfig();
}

const char* Session::sideName(Side side) {
  return side == PROCESS ? "process" : "engine";
}

const char* Session::statusName(Status status) {
  switch (status) {
    case WAITING:
      return "waiting";
    case RUNNING:
      return "running";
    case ERROR:
      return "error";
    case EXITED:
      return "exited";
  }
  return "unknown";
}

bool Session::isUnicode() const {
  const EngineProfile* profile = Handshake::findProfile(config.engineMark);
  return profile != NULL && profile->unicode;
}

void Session::applyConfig() {
  codec = TokenCodec(isUnicode());
  if (side == ENGINE) {
    channel->setPadWrites(config.naiveFlush);
  } else {
    channel->setSkipFlushLines(config.naiveFlush);
  }
}

int64_t Session::readTimeoutMs() const {
  // The engine's reads cannot be bounded
  return side == PROCESS ? config.timeoutMs : 0;
}

void Session::announce() {
  if (side != ENGINE) {
    throw std::logic_error("Only the engine announces itself");
  }
  if (status != WAITING) {
    throw ProtocolError(ProtocolError::SESSION_CLOSED,
                        string("cannot announce a session that is ") +
                            statusName(status));
  }
  string line = Handshake::buildIdentityLine(config);
  try {
    channel->writeLines(vector<string>(1, line));
  } catch (const ProtocolError&) {
    fail();
    throw;
  }
  turn = false;
  status = RUNNING;
  VLOG(1) << "Announced engine mark " << config.engineMark << ", driver "
          << SessionConfig::driverName(config.driver);
}

void Session::acceptIdentity() {
  if (side != PROCESS) {
    throw std::logic_error("Only the process accepts an identity line");
  }
  if (status != WAITING) {
    throw ProtocolError(ProtocolError::SESSION_CLOSED,
                        string("cannot handshake a session that is ") +
                            statusName(status));
  }
  string line;
  if (!readLine(&line)) {
    fail();
    throw ProtocolError(ProtocolError::HANDSHAKE_EXPECTED,
                        "stream ended before the identity line");
  }
  SessionConfig remote;
  try {
    remote = Handshake::parseIdentityLine(line);
  } catch (const ProtocolError&) {
    fail();
    throw;
  }
  config.engineMark = remote.engineMark;
  config.driver = remote.driver;
  config.naiveFlush = remote.naiveFlush;
  config.communicator = remote.communicator;
  applyConfig();
  status = RUNNING;
  VLOG(1) << "Engine identified as " << config.engineMark << " ("
          << (isUnicode() ? "unicode" : "bytes") << "), driver "
          << SessionConfig::driverName(config.driver);
}

void Session::checkUsable() const {
  if (status == WAITING) {
    throw ProtocolError(ProtocolError::HANDSHAKE_EXPECTED,
                        "no identity line exchanged yet");
  }
  if (status != RUNNING) {
    throw ProtocolError(ProtocolError::SESSION_CLOSED,
                        string("session is ") + statusName(status));
  }
}

void Session::send(const vector<string>& lines) {
  checkUsable();
  if (!turn) {
    fail();
    throw ProtocolError(ProtocolError::OUT_OF_TURN,
                        "the peer is still producing a message");
  }
  try {
    channel->writeLines(lines);
  } catch (const ProtocolError&) {
    fail();
    throw;
  }
  turn = false;
}

bool Session::readLine(string* line) {
  if (status == ERROR || status == EXITED) {
    throw ProtocolError(ProtocolError::SESSION_CLOSED,
                        string("session is ") + statusName(status));
  }
  bool gotLine;
  try {
    gotLine = channel->readLine(line, readTimeoutMs());
  } catch (const ProtocolError&) {
    fail();
    throw;
  }
  if (gotLine) {
    turn = true;
  }
  return gotLine;
}

vector<string> Session::readBlock() {
  checkUsable();
  vector<string> lines;
  try {
    lines = BlockProtocol::receiveBlock(channel.get(), readTimeoutMs());
  } catch (const ProtocolError&) {
    fail();
    throw;
  }
  turn = true;
  return lines;
}

void Session::fail() {
  if (status != ERROR) {
    LOG(ERROR) << "Session on the " << sideName(side) << " side failed";
  }
  status = ERROR;
  channel->markUnusable();
  turn = false;
}

void Session::close() {
  if (closed) {
    return;
  }
  closed = true;
  if (status == RUNNING || status == WAITING) {
    status = EXITED;
  }
  channel->closeWrite();
  VLOG(1) << "Session on the " << sideName(side) << " side closed ("
          << statusName(status) << ")";
  for (auto& callback : onCloseCallbacks) {
    callback();
  }
}
}  // namespace imm

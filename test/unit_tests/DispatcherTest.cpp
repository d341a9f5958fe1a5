#include "PipePeers.hpp"

using namespace imm;

namespace {
SessionConfig makeConfig(SessionConfig::Driver driver) {
  SessionConfig config;
  config.driver = driver;
  config.timeoutMs = 2000;
  return config;
}

int protocolErrorKind(function<void()> body) {
  try {
    body();
  } catch (const ProtocolError& e) {
    return int(e.getKind());
  }
  return -1;
}
}  // namespace

TEST_CASE("HandlerTable registration", "[Dispatcher]") {
  HandlerTable table;
  auto body = [](Dispatcher*, const Argument&) { return string("x"); };
  table.add("zeta", ArgumentKind::NONE, body);
  table.add("alpha", ArgumentKind::LINE, body);

  REQUIRE(table.size() == 2);
  REQUIRE(table.contains("alpha"));
  REQUIRE(table.find("alpha")->getArgumentKind() == ArgumentKind::LINE);
  REQUIRE(table.find("missing").get() == NULL);
  REQUIRE(table.names() == vector<string>({"alpha", "zeta"}));

  REQUIRE_THROWS_AS(table.add("alpha", ArgumentKind::NONE, body),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(table.add("", ArgumentKind::NONE, body),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(table.add("two\nlines", ArgumentKind::NONE, body),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(table.add("empty", shared_ptr<Handler>()),
                    std::invalid_argument);
}

TEST_CASE("Return without an open frame", "[Dispatcher]") {
  PipePeers peers;
  shared_ptr<Session> session =
      peers.makeEngineSession(makeConfig(SessionConfig::PROCESS));
  session->announce();
  EngineDispatcher dispatcher(session, make_shared<HandlerTable>());

  REQUIRE(protocolErrorKind([&]() { dispatcher.returnToCaller("42"); }) ==
          ProtocolError::NO_OPEN_FRAME);
  REQUIRE(session->getStatus() == Session::ERROR);
  REQUIRE(protocolErrorKind([&]() {
            dispatcher.invokeRemote("anything", Argument::none());
          }) == ProtocolError::SESSION_CLOSED);
}

TEST_CASE("Invoking before the handshake", "[Dispatcher]") {
  PipePeers peers;
  shared_ptr<Session> session =
      peers.makeProcessSession(makeConfig(SessionConfig::PROCESS));
  ProcessDispatcher dispatcher(session, make_shared<HandlerTable>());

  REQUIRE(protocolErrorKind([&]() {
            dispatcher.invokeRemote("double", Argument::text("1"));
          }) == ProtocolError::HANDSHAKE_EXPECTED);
  REQUIRE(session->getStatus() == Session::WAITING);
}

TEST_CASE("Sending while the peer holds the turn", "[Dispatcher]") {
  PipePeers peers;
  shared_ptr<Session> session =
      peers.makeEngineSession(makeConfig(SessionConfig::PROCESS));
  session->announce();
  REQUIRE_FALSE(session->hasTurn());
  EngineDispatcher dispatcher(session, make_shared<HandlerTable>());

  REQUIRE(protocolErrorKind([&]() {
            dispatcher.invokeRemote("double", Argument::text("1"));
          }) == ProtocolError::OUT_OF_TURN);
  REQUIRE(session->getStatus() == Session::ERROR);
}

TEST_CASE("Handshake must come first", "[Dispatcher]") {
  PipePeers peers;
  shared_ptr<Session> session =
      peers.makeProcessSession(makeConfig(SessionConfig::PROCESS));
  peers.engineChannel->writeLine("idouble");

  REQUIRE(protocolErrorKind([&]() { session->acceptIdentity(); }) ==
          ProtocolError::HANDSHAKE_EXPECTED);
  REQUIRE(session->getStatus() == Session::ERROR);
}

TEST_CASE("Garbage where a message belongs", "[Dispatcher]") {
  PipePeers peers;
  shared_ptr<Session> engineSession =
      peers.makeEngineSession(makeConfig(SessionConfig::PROCESS));
  engineSession->announce();
  peers.engineChannel->writeLine("zzz");

  shared_ptr<Session> session =
      peers.makeProcessSession(makeConfig(SessionConfig::PROCESS));
  session->acceptIdentity();
  REQUIRE(session->getStatus() == Session::RUNNING);
  REQUIRE(session->hasTurn());
  ProcessDispatcher dispatcher(session, make_shared<HandlerTable>());

  try {
    dispatcher.invokeRemote("double", Argument::text("1"));
    FAIL("invokeRemote should have thrown");
  } catch (const ProtocolError& e) {
    REQUIRE(e.getKind() == ProtocolError::UNEXPECTED_MESSAGE_KIND);
    REQUIRE(e.getCallSite() == "double@engine");
  }
  REQUIRE(session->getStatus() == Session::ERROR);
}

TEST_CASE("Peer invokes a handler this side does not have", "[Dispatcher]") {
  PipePeers peers;
  shared_ptr<Session> engineSession =
      peers.makeEngineSession(makeConfig(SessionConfig::ENGINE));
  engineSession->announce();
  peers.engineChannel->writeLines({"inope", "argument"});

  shared_ptr<Session> session =
      peers.makeProcessSession(makeConfig(SessionConfig::PROCESS));
  session->acceptIdentity();
  shared_ptr<HandlerTable> handlers(new HandlerTable());
  handlers->add("echo", ArgumentKind::LINE,
                [](Dispatcher*, const Argument& arg) { return arg.line; });
  ProcessDispatcher dispatcher(session, handlers);

  REQUIRE(protocolErrorKind([&]() { dispatcher.serve(); }) ==
          ProtocolError::UNKNOWN_HANDLER);
  REQUIRE(session->getStatus() == Session::ERROR);

  // The engine still learns why
  REQUIRE(BlockProtocol::receiveBlock(peers.engineChannel.get(), 1000) ==
          vector<string>({"echo"}));
  string line;
  REQUIRE(peers.engineChannel->readLine(&line, 1000));
  REQUIRE(line == "eunknown handler nope");
  REQUIRE(BlockProtocol::receiveBlock(peers.engineChannel.get(), 1000) ==
          vector<string>({"nope@process"}));
}

TEST_CASE("Malformed token list argument ends the session", "[Dispatcher]") {
  PipePeers peers;
  shared_ptr<Session> engineSession =
      peers.makeEngineSession(makeConfig(SessionConfig::ENGINE));
  engineSession->announce();
  peers.engineChannel->writeLines({"itokens", "BaZb"});

  shared_ptr<Session> session =
      peers.makeProcessSession(makeConfig(SessionConfig::PROCESS));
  session->acceptIdentity();
  shared_ptr<HandlerTable> handlers(new HandlerTable());
  handlers->add("tokens", ArgumentKind::TOKEN_LIST,
                [](Dispatcher*, const Argument& arg) {
                  return to_string(arg.tokens.size());
                });
  ProcessDispatcher dispatcher(session, handlers);

  REQUIRE_THROWS_AS(dispatcher.serve(), DecodeError);
  REQUIRE(session->getStatus() == Session::ERROR);
}

TEST_CASE("Return values with a line break become failures", "[Dispatcher]") {
  PipePeers peers;
  shared_ptr<Session> engineSession =
      peers.makeEngineSession(makeConfig(SessionConfig::ENGINE));
  engineSession->announce();
  peers.engineChannel->writeLines({"ibad", "r"});

  shared_ptr<Session> session =
      peers.makeProcessSession(makeConfig(SessionConfig::PROCESS));
  session->acceptIdentity();
  shared_ptr<HandlerTable> handlers(new HandlerTable());
  handlers->add("bad", ArgumentKind::NONE,
                [](Dispatcher*, const Argument&) { return string("a\nb"); });
  ProcessDispatcher dispatcher(session, handlers);

  dispatcher.serve();
  REQUIRE(session->getStatus() == Session::EXITED);

  REQUIRE(BlockProtocol::receiveBlock(peers.engineChannel.get(), 1000) ==
          vector<string>({"bad"}));
  string line;
  REQUIRE(peers.engineChannel->readLine(&line, 1000));
  REQUIRE(line == "eReturn value of bad contains a line break");
  REQUIRE(BlockProtocol::receiveBlock(peers.engineChannel.get(), 1000) ==
          vector<string>({"bad@process"}));
  // serve() closed the process side
  REQUIRE_FALSE(peers.engineChannel->readLine(&line, 1000));
}

TEST_CASE("Closing runs callbacks once", "[Dispatcher]") {
  PipePeers peers;
  shared_ptr<Session> session =
      peers.makeEngineSession(makeConfig(SessionConfig::PROCESS));
  vector<int> calls;
  session->addOnClose([&]() { calls.push_back(1); });
  session->addOnClose([&]() { calls.push_back(2); });
  session->announce();
  session->close();
  session->close();
  REQUIRE(calls == vector<int>({1, 2}));
  REQUIRE(session->getStatus() == Session::EXITED);
  REQUIRE(protocolErrorKind([&]() { session->send({"r"}); }) ==
          ProtocolError::SESSION_CLOSED);
}

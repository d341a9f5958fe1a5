#include "ChildProcessEngine.hpp"
#include "HostHandlers.hpp"
#include "TestHeaders.hpp"

using namespace imm;

namespace {
class EngineLogDirectory {
 public:
  EngineLogDirectory() {
    string pattern = GetTempDirectory() + string("imm_engine_XXXXXXXX");
    path = string(mkdtemp(&pattern[0]));
  }
  ~EngineLogDirectory() { fs::remove_all(path); }

  string path;
};
}  // namespace

TEST_CASE("Drive a child engine", "[ChildProcessEngine]") {
  EngineLogDirectory logDirectory;
  shared_ptr<HandlerTable> handlers(new HandlerTable());
  registerHostHandlers(handlers.get());
  SessionConfig config;

  ChildProcessEngine engine(
      IMM_ENGINE_PATH, {"--listen", "--mark", "x", "--logdir", logDirectory.path},
      config, handlers);
  engine.start();
  REQUIRE(engine.getPid() > 0);
  REQUIRE(engine.getSession()->getEngineMark() == 'x');
  REQUIRE(engine.getSession()->isUnicode());

  REQUIRE(engine.invoke("double", Argument::text("21")) == "42");
  // square calls compute back in this process
  REQUIRE(engine.invoke("square", Argument::text("7")) == "49");

  TokenList tokens = {Token::controlSequence("par"),
                      Token::character(Catcode::LETTER, U'é')};
  REQUIRE(engine.invoke("tokens", Argument::tokenList(tokens)) == "2");

  REQUIRE_THROWS_AS(engine.invoke("fail", Argument::text("on purpose")),
                    RemoteFailure);
  REQUIRE(engine.getSession()->getStatus() == Session::RUNNING);

  REQUIRE(engine.close() == 0);
  REQUIRE(engine.getSession()->getStatus() == Session::EXITED);
}

TEST_CASE("Engine that never announces itself", "[ChildProcessEngine]") {
  shared_ptr<HandlerTable> handlers(new HandlerTable());
  ChildProcessEngine engine("imm-no-such-engine", {}, SessionConfig(),
                            handlers);
  try {
    engine.start();
    FAIL("start should have thrown");
  } catch (const ProtocolError& e) {
    REQUIRE(e.getKind() == ProtocolError::HANDSHAKE_EXPECTED);
  }
  REQUIRE(engine.getSession()->getStatus() == Session::ERROR);
  REQUIRE(engine.close() == 127);
}

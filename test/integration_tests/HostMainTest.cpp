#include "Handshake.hpp"
#include "SubprocessUtils.hpp"
#include "TestHeaders.hpp"

using namespace imm;

namespace {
string readAll(int fd) {
  string result;
  char buf[1024];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n <= 0) {
      break;
    }
    result.append(buf, n);
  }
  return result;
}

/**
 * Starts imm-host, announces an engine-driven session whose replies should
 * go through communicator, and returns the exit code of the host.
 */
int runHostWithCommunicator(const string& communicator, string* output) {
  string pattern = GetTempDirectory() + string("imm_host_XXXXXXXX");
  string logDirectory = string(mkdtemp(&pattern[0]));

  SessionConfig config;
  config.engineMark = 'p';
  config.driver = SessionConfig::ENGINE;
  config.communicator = communicator;
  string identity = Handshake::buildIdentityLine(config) + "\n";

  SubprocessUtils utils;
  ChildProcess child =
      utils.spawn(IMM_HOST_PATH, {"--logdir", logDirectory, "--timeout", "5000"});
  REQUIRE(::write(child.toChildFd, identity.c_str(), identity.length()) ==
          ssize_t(identity.length()));
  *output = readAll(child.fromChildFd);
  ::close(child.toChildFd);
  ::close(child.fromChildFd);
  int exitCode = utils.waitForExit(child.pid);
  fs::remove_all(logDirectory);
  return exitCode;
}
}  // namespace

TEST_CASE("Host exits cleanly when the communicator is unusable",
          "[HostMain]") {
  string output;

  SECTION("unknown communicator") {
    REQUIRE(runHostWithCommunicator("zbogus", &output) == 1);
  }

  SECTION("forwarder that does not exist") {
    REQUIRE(runHostWithCommunicator("u2147483646,3", &output) == 1);
  }

  REQUIRE(output.empty());
}

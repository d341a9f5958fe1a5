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
}  // namespace

TEST_CASE("SubprocessUtils spawn captures stdout", "[SubprocessUtils]") {
  SubprocessUtils utils;
  ChildProcess child = utils.spawn("printf", {"test123"});
  REQUIRE(child.pid > 0);
  ::close(child.toChildFd);
  REQUIRE(readAll(child.fromChildFd) == "test123");
  ::close(child.fromChildFd);
  REQUIRE(utils.waitForExit(child.pid) == 0);
}

TEST_CASE("SubprocessUtils spawn feeds stdin", "[SubprocessUtils]") {
  SubprocessUtils utils;
  ChildProcess child = utils.spawn("cat", {});
  string input = "line one\nline two\n";
  REQUIRE(::write(child.toChildFd, input.c_str(), input.length()) ==
          ssize_t(input.length()));
  ::close(child.toChildFd);
  REQUIRE(readAll(child.fromChildFd) == input);
  ::close(child.fromChildFd);
  REQUIRE(utils.waitForExit(child.pid) == 0);
}

TEST_CASE("SubprocessUtils reports exit codes", "[SubprocessUtils]") {
  SubprocessUtils utils;

  SECTION("non zero exit") {
    ChildProcess child = utils.spawn("sh", {"-c", "exit 3"});
    ::close(child.toChildFd);
    ::close(child.fromChildFd);
    REQUIRE(utils.waitForExit(child.pid) == 3);
  }

  SECTION("missing program") {
    ChildProcess child = utils.spawn("imm-no-such-program-here", {});
    ::close(child.toChildFd);
    ::close(child.fromChildFd);
    REQUIRE(utils.waitForExit(child.pid) == 127);
  }
}

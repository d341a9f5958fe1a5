#include "Channel.hpp"
#include "Communicator.hpp"
#include "TestHeaders.hpp"

using namespace imm;

namespace {
/**
 * Runs a forwarder into a pipe, connects to it with the communicator named
 * by its descriptor line and checks that what we write comes out of the
 * pipe.
 */
void roundTripThroughForwarder(
    function<void(shared_ptr<TcpSocketHandler>, int)> forward,
    char expectedCharacter) {
  shared_ptr<TcpSocketHandler> forwarderHandler(new TcpSocketHandler());
  shared_ptr<TcpSocketHandler> readerHandler(new TcpSocketHandler());
  shared_ptr<TcpSocketHandler> writerHandler(new TcpSocketHandler());
  int fds[2];
  FATAL_FAIL(::pipe(fds));
  readerHandler->adopt(fds[0]);
  forwarderHandler->adopt(fds[1]);

  std::exception_ptr forwarderError;
  std::thread forwarder([&]() {
    try {
      forward(forwarderHandler, fds[1]);
    } catch (const std::exception&) {
      forwarderError = std::current_exception();
    }
  });

  Channel output(readerHandler, fds[0], -1);
  string descriptor;
  REQUIRE(output.readLine(&descriptor, 5000));
  REQUIRE(descriptor[0] == expectedCharacter);

  shared_ptr<Communicator> communicator =
      createCommunicator(descriptor, writerHandler);
  REQUIRE(communicator->getCharacter() == expectedCharacter);
  int fd = communicator->open();
  REQUIRE(fd >= 0);
  string payload = "rfirst\nrsecond\n";
  writerHandler->writeAllOrThrow(fd, payload.c_str(), payload.length());
  communicator->close();

  forwarder.join();
  if (forwarderError) {
    std::rethrow_exception(forwarderError);
  }
  forwarderHandler->close(fds[1]);

  string line;
  REQUIRE(output.readLine(&line, 5000));
  REQUIRE(line == "rfirst");
  REQUIRE(output.readLine(&line, 5000));
  REQUIRE(line == "rsecond");
  REQUIRE_FALSE(output.readLine(&line, 5000));
  readerHandler->close(fds[0]);
}
}  // namespace

TEST_CASE("Descriptor lines select the communicator", "[Communicator]") {
  shared_ptr<TcpSocketHandler> socketHandler(new TcpSocketHandler());
  REQUIRE(createCommunicator("m4242", socketHandler)->getCharacter() == 'm');
  REQUIRE(createCommunicator("u100,7", socketHandler)->getCharacter() == 'u');

  REQUIRE_THROWS_AS(createCommunicator("", socketHandler),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(createCommunicator("x1", socketHandler),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(createCommunicator("mport", socketHandler),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(createCommunicator("m70000", socketHandler),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(createCommunicator("u100", socketHandler),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(createCommunicator("ua,b", socketHandler),
                    std::invalid_argument);
}

TEST_CASE("Network forwarder relays a connection", "[Communicator]") {
  roundTripThroughForwarder(
      [](shared_ptr<TcpSocketHandler> socketHandler, int outFd) {
        NetworkCommunicator::forward(socketHandler, outFd);
      },
      NetworkCommunicator::CHARACTER);
}

TEST_CASE("Unnamed pipe forwarder relays writes", "[Communicator]") {
  if (!UnnamedPipeCommunicator::isAvailable()) {
    WARN("No /proc filesystem, skipping");
    return;
  }
  roundTripThroughForwarder(
      [](shared_ptr<TcpSocketHandler> socketHandler, int outFd) {
        UnnamedPipeCommunicator::forward(socketHandler, outFd);
      },
      UnnamedPipeCommunicator::CHARACTER);
}

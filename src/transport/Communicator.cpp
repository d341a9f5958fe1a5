#include "Communicator.hpp"

namespace imm {
void Communicator::close() {
  if (fd >= 0) {
    socketHandler->close(fd);
    fd = -1;
  }
}

int64_t copyUntilClosed(shared_ptr<SocketHandler> socketHandler, int inFd,
                        int outFd) {
  int64_t total = 0;
  char buf[4096];
  while (true) {
    ssize_t bytesRead = socketHandler->read(inFd, buf, sizeof(buf));
    if (bytesRead == 0) {
      break;
    }
    if (bytesRead < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      throw std::runtime_error(string("Forwarder read failed: ") +
                               strerror(errno));
    }
    socketHandler->writeAllOrThrow(outFd, buf, bytesRead);
    total += bytesRead;
  }
  VLOG(1) << "Forwarded " << total << " bytes";
  return total;
}

UnnamedPipeCommunicator::UnnamedPipeCommunicator(
    shared_ptr<TcpSocketHandler> _socketHandler, const string& descriptor)
    : Communicator(_socketHandler) {
  auto tokens = split(descriptor, ',');
  if (tokens.size() != 2) {
    throw std::invalid_argument("Bad unnamed pipe descriptor: " + descriptor);
  }
  try {
    pid = stoi(tokens[0]);
    remoteFd = stoi(tokens[1]);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Bad unnamed pipe descriptor: " + descriptor);
  }
}

bool UnnamedPipeCommunicator::isAvailable() {
  return fs::is_directory("/proc/self/fd");
}

int UnnamedPipeCommunicator::open() {
  string path = "/proc/" + to_string(pid) + "/fd/" + to_string(remoteFd);
  fd = ::open(path.c_str(), O_WRONLY);
  if (fd < 0) {
    throw std::runtime_error("Could not open " + path + ": " +
                             strerror(errno));
  }
  socketHandler->adopt(fd);
  VLOG(1) << "Writing through " << path;
  return fd;
}

void UnnamedPipeCommunicator::forward(shared_ptr<SocketHandler> socketHandler,
                                      int outFd) {
  int fds[2];
  FATAL_FAIL(::pipe(fds));
  socketHandler->adopt(fds[0]);
  string line = string(1, CHARACTER) + to_string(::getpid()) + "," +
                to_string(fds[1]) + "\n";
  socketHandler->writeAllOrThrow(outFd, line.c_str(), line.length());

  // Keep our own write end open until the first bytes arrive, so the read
  // does not see end of stream before the writer has opened the pipe.
  char buf[4096];
  ssize_t bytesRead;
  do {
    bytesRead = socketHandler->read(fds[0], buf, sizeof(buf));
  } while (bytesRead < 0 && errno == EINTR);
  FATAL_FAIL(::close(fds[1]));
  if (bytesRead > 0) {
    socketHandler->writeAllOrThrow(outFd, buf, bytesRead);
    copyUntilClosed(socketHandler, fds[0], outFd);
  }
  socketHandler->close(fds[0]);
}

NetworkCommunicator::NetworkCommunicator(
    shared_ptr<TcpSocketHandler> _socketHandler, const string& descriptor)
    : Communicator(_socketHandler) {
  try {
    port = stoi(descriptor);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Bad port in network descriptor: " +
                                descriptor);
  }
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Bad port in network descriptor: " +
                                descriptor);
  }
}

int NetworkCommunicator::open() {
  fd = socketHandler->connect(SocketEndpoint("localhost", port));
  if (fd < 0) {
    throw std::runtime_error("Could not connect to forwarder on port " +
                             to_string(port));
  }
  return fd;
}

void NetworkCommunicator::forward(shared_ptr<TcpSocketHandler> socketHandler,
                                  int outFd) {
  int serverFd = socketHandler->listen(SocketEndpoint("localhost", 0));
  string line = string(1, CHARACTER) +
                to_string(socketHandler->getBoundPort(serverFd)) + "\n";
  socketHandler->writeAllOrThrow(outFd, line.c_str(), line.length());

  int clientFd = socketHandler->accept(serverFd);
  socketHandler->close(serverFd);
  copyUntilClosed(socketHandler, clientFd, outFd);
  socketHandler->close(clientFd);
}

shared_ptr<Communicator> createCommunicator(
    const string& line, shared_ptr<TcpSocketHandler> socketHandler) {
  if (line.empty()) {
    throw std::invalid_argument("Empty communicator descriptor");
  }
  switch (line[0]) {
    case UnnamedPipeCommunicator::CHARACTER:
      return shared_ptr<Communicator>(
          new UnnamedPipeCommunicator(socketHandler, line.substr(1)));
    case NetworkCommunicator::CHARACTER:
      return shared_ptr<Communicator>(
          new NetworkCommunicator(socketHandler, line.substr(1)));
    default:
      throw std::invalid_argument("Unknown communicator: " + line);
  }
}
}  // namespace imm

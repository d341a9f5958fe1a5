#include "TcpSocketHandler.hpp"

namespace imm {
TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  int sockFd = -1;
  addrinfo *results = NULL;
  addrinfo *p = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_ADDRCONFIG;
  std::string portname = std::to_string(endpoint.getPort());
  std::string hostname =
      endpoint.getName().empty() ? "localhost" : endpoint.getName();

  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  // loop through all the results and connect to the first we can
  for (p = results; p != NULL; p = p->ai_next) {
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << errno << " "
                << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
    break;
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(ERROR) << "Could not connect to " << endpoint;
    return -1;
  }
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

int TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  int sockFd = socket(AF_INET, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  {
    int flag = 1;
    FATAL_FAIL(
        setsockopt(sockFd, SOL_SOCKET, SO_REUSEADDR, (char *)&flag, sizeof(int)));
  }

  sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(endpoint.getPort());
  if (::bind(sockFd, (sockaddr *)&addr, sizeof(addr)) == -1) {
    // This most often happens because the port is in use.
    stringstream oss;
    oss << "Error binding port " << endpoint.getPort() << ": " << errno << " "
        << strerror(errno);
    string s = oss.str();
    ::close(sockFd);
    throw std::runtime_error(s.c_str());
  }

  FATAL_FAIL(::listen(sockFd, 1));
  addToActiveSockets(sockFd);
  LOG(INFO) << "Listening on localhost:" << getBoundPort(sockFd);
  return sockFd;
}

int TcpSocketHandler::accept(int serverFd) {
  sockaddr_in client;
  socklen_t c = sizeof(sockaddr_in);
  int clientFd;
  do {
    clientFd = ::accept(serverFd, (sockaddr *)&client, &c);
  } while (clientFd == -1 && errno == EINTR);
  FATAL_FAIL(clientFd);
  VLOG(3) << "Socket " << serverFd << " accepted client " << clientFd;
  addToActiveSockets(clientFd);
  initSocket(clientFd);
  return clientFd;
}

int TcpSocketHandler::getBoundPort(int serverFd) {
  sockaddr_in addr;
  socklen_t len = sizeof(addr);
  FATAL_FAIL(::getsockname(serverFd, (sockaddr *)&addr, &len));
  return ntohs(addr.sin_port);
}

void TcpSocketHandler::initSocket(int fd) {
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace imm

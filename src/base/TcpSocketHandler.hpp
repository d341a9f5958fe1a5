#ifndef __IMM_TCP_SOCKET_HANDLER__
#define __IMM_TCP_SOCKET_HANDLER__

#include "SocketEndpoint.hpp"
#include "UnixSocketHandler.hpp"

namespace imm {
/**
 * @brief Implements loopback TCP operations built on top of
 * UnixSocketHandler.
 *
 * The network transport only ever links two processes on the same machine,
 * so listening sockets are bound to the loopback interface.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects to the server. Returns -1
   * on failure.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on the loopback interface. A port of 0 asks the
   * kernel for a free port; query it with getBoundPort().
   */
  virtual int listen(const SocketEndpoint& endpoint);
  /**
   * @brief Blocks until a client connects to the listening socket.
   */
  virtual int accept(int serverFd);
  /**
   * @brief Returns the local port a listening socket was bound to.
   */
  int getBoundPort(int serverFd);

 protected:
  /**
   * @brief Performs TCP-specific socket configuration (NODELAY).
   */
  virtual void initSocket(int fd);
};
}  // namespace imm

#endif  // __IMM_TCP_SOCKET_HANDLER__

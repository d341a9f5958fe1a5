#ifndef __IMM_COMMUNICATOR__
#define __IMM_COMMUNICATOR__

#include "TcpSocketHandler.hpp"

namespace imm {
/**
 * @brief Lets a Process whose stdout is not connected to the Engine write to
 * it anyway.
 *
 * A forwarder started by the Engine prints one descriptor line, which the
 * Engine relays to the Process in its configuration. The Process builds a
 * Communicator from that line and writes through it; the forwarder copies
 * everything it receives to its own stdout, which the Engine reads.
 */
class Communicator {
 public:
  explicit Communicator(shared_ptr<TcpSocketHandler> _socketHandler)
      : socketHandler(_socketHandler), fd(-1) {}
  virtual ~Communicator() {}

  /**
   * @brief Opens the connection and returns a descriptor adopted by the
   * socket handler. Throws std::runtime_error on failure.
   */
  virtual int open() = 0;

  virtual char getCharacter() const = 0;

  /** @brief Closes the connection, which ends the forwarder. */
  void close();

  int getFd() const { return fd; }

 protected:
  shared_ptr<TcpSocketHandler> socketHandler;
  int fd;
};

/**
 * @brief Writes into the forwarder's pipe through /proc/<pid>/fd/<fd>.
 * Descriptor line: `u<pid>,<fd>`.
 */
class UnnamedPipeCommunicator : public Communicator {
 public:
  static constexpr char CHARACTER = 'u';

  UnnamedPipeCommunicator(shared_ptr<TcpSocketHandler> _socketHandler,
                          const string& descriptor);

  virtual int open();
  virtual char getCharacter() const { return CHARACTER; }

  static bool isAvailable();

  /**
   * @brief Forwarder side: writes the descriptor line to outFd, then copies
   * the pipe to outFd until every writer has closed it.
   */
  static void forward(shared_ptr<SocketHandler> socketHandler, int outFd);

 protected:
  pid_t pid;
  int remoteFd;
};

/**
 * @brief Connects to the forwarder over localhost TCP.
 * Descriptor line: `m<port>`.
 */
class NetworkCommunicator : public Communicator {
 public:
  static constexpr char CHARACTER = 'm';

  NetworkCommunicator(shared_ptr<TcpSocketHandler> _socketHandler,
                      const string& descriptor);

  virtual int open();
  virtual char getCharacter() const { return CHARACTER; }

  static bool isAvailable() { return true; }

  /**
   * @brief Forwarder side: listens on a free localhost port, writes the
   * descriptor line to outFd, then copies the single accepted connection to
   * outFd until it closes.
   */
  static void forward(shared_ptr<TcpSocketHandler> socketHandler, int outFd);

 protected:
  int port;
};

/**
 * @brief Builds the communicator named by a descriptor line. Throws
 * std::invalid_argument for an unknown or malformed line.
 */
shared_ptr<Communicator> createCommunicator(
    const string& line, shared_ptr<TcpSocketHandler> socketHandler);

/**
 * @brief Copies inFd to outFd until inFd reaches end of stream. Returns the
 * number of bytes copied.
 */
int64_t copyUntilClosed(shared_ptr<SocketHandler> socketHandler, int inFd,
                        int outFd);
}  // namespace imm

#endif  // __IMM_COMMUNICATOR__

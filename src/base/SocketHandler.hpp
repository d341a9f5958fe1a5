#ifndef __IMM_SOCKET_HANDLER__
#define __IMM_SOCKET_HANDLER__

#include "Headers.hpp"

namespace imm {
/**
 * @brief Provides an abstract API for descriptor reads/writes and lifecycle
 * management.
 *
 * The bridge only ever talks over already-open byte streams (pipes, stdio or
 * a connected socket), so a handler does not care how a descriptor was
 * created; it only has to be told about it with adopt().
 */
class SocketHandler {
 public:
  /** @brief Ensures derived handlers can clean up platform-specific resources.
   */
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks with select() until the fd becomes readable or the timeout
   * passes.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) = 0;
  /**
   * @brief Returns true when the kernel reports data ready to read on a
   * descriptor.
   */
  virtual bool hasData(int fd) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Starts tracking a descriptor that was opened elsewhere.
   */
  virtual void adopt(int fd) = 0;
  /** @brief Closes the supplied descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently tracked descriptors. */
  virtual vector<int> getActiveSockets() = 0;

  /**
   * @brief Writes all bytes, retrying on EAGAIN. Throws std::runtime_error
   * when the descriptor fails or closes.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count);
};
}  // namespace imm

#endif  // __IMM_SOCKET_HANDLER__

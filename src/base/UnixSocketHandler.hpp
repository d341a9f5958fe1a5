#ifndef __IMM_UNIX_SOCKET_HANDLER__
#define __IMM_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace imm {
/**
 * @brief Default SocketHandler implementation over POSIX descriptors with
 * mutex guards. Works for pipes and stdio as well as stream sockets.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  /** @brief Queries whether the descriptor currently has readable bytes. */
  virtual bool hasData(int fd);
  /** @brief Reads up to `count` bytes while holding the per-descriptor mutex.
   */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes `count` bytes by retrying until completion or timeout. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual void adopt(int fd);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

 protected:
  /**
   * @brief Ensures that a descriptor is tracked and has its own mutex.
   */
  void addToActiveSockets(int fd);

  /** @brief Mutex per active descriptor to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active descriptor map. */
  recursive_mutex globalMutex;
};
}  // namespace imm

#endif  // __IMM_UNIX_SOCKET_HANDLER__

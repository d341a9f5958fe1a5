#ifndef __IMM_SUBPROCESS_UTILS__
#define __IMM_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace imm {
/**
 * @brief A child process whose stdin and stdout are connected to pipes owned
 * by the parent.
 */
struct ChildProcess {
  pid_t pid = -1;
  /** @brief Write end of the child's stdin. */
  int toChildFd = -1;
  /** @brief Read end of the child's stdout. */
  int fromChildFd = -1;
};

/**
 * @brief Utility class for launching subprocesses wired to pipes.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Forks and execs command without a shell. stderr is inherited.
   * Throws std::runtime_error when the pipes or the fork cannot be created.
   */
  virtual ChildProcess spawn(const string& command, const vector<string>& args);

  /**
   * @brief Waits for the child to exit and returns its exit status, or -1 if
   * it was killed by a signal.
   */
  virtual int waitForExit(pid_t pid);
};
}  // namespace imm

#endif  // __IMM_SUBPROCESS_UTILS__

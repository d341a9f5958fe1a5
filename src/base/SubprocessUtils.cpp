#include "SubprocessUtils.hpp"

namespace imm {
ChildProcess SubprocessUtils::spawn(const string& command,
                                    const vector<string>& args) {
  int link_in[2];
  int link_out[2];
  if (pipe(link_in) == -1) {
    throw std::runtime_error(string("pipe failed: ") + strerror(errno));
  }
  if (pipe(link_out) == -1) {
    auto localErrno = errno;
    ::close(link_in[0]);
    ::close(link_in[1]);
    throw std::runtime_error(string("pipe failed: ") + strerror(localErrno));
  }

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(link_in[0], STDIN_FILENO);
    dup2(link_out[1], STDOUT_FILENO);
    close(link_in[0]);
    close(link_in[1]);
    close(link_out[0]);
    close(link_out[1]);

    char** argsArray = new char*[args.size() + 2];
    argsArray[0] = strdup(command.c_str());
    for (size_t a = 0; a < args.size(); a++) {
      argsArray[a + 1] = strdup(args[a].c_str());
    }
    argsArray[args.size() + 1] = NULL;
    execvp(command.c_str(), argsArray);

    // Only reached when exec fails.  Logging is not safe after fork.
    fprintf(stderr, "execvp %s failed: %s\n", command.c_str(), strerror(errno));
    for (size_t a = 0; a <= args.size(); a++) {
      free(argsArray[a]);
    }
    delete[] argsArray;
    _exit(127);
  } else if (pid > 0) {
    // parent process
    close(link_in[0]);
    close(link_out[1]);
    ChildProcess child;
    child.pid = pid;
    child.toChildFd = link_in[1];
    child.fromChildFd = link_out[0];
    VLOG(1) << "Spawned " << command << " as pid " << pid;
    return child;
  } else {
    auto localErrno = errno;
    close(link_in[0]);
    close(link_in[1]);
    close(link_out[0]);
    close(link_out[1]);
    throw std::runtime_error(string("Failed to fork: ") +
                             strerror(localErrno));
  }
}

int SubprocessUtils::waitForExit(pid_t pid) {
  int status = 0;
  pid_t rc;
  do {
    rc = waitpid(pid, &status, 0);
  } while (rc == -1 && errno == EINTR);
  if (rc == -1) {
    LOG(WARNING) << "waitpid failed for " << pid << ": " << strerror(errno);
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}
}  // namespace imm

#ifndef __IMM_COMMUNICATION_LOG__
#define __IMM_COMMUNICATION_LOG__

#include "Headers.hpp"

namespace imm {
/**
 * @brief Appends every protocol line that crosses a Channel to a file.
 *
 * Lines read are prefixed with `>`, lines written with `<`. A `$pid`
 * placeholder in the path is replaced by the current process id.
 */
class CommunicationLog {
 public:
  explicit CommunicationLog(const string& pathTemplate);

  void logRead(const string& line) { append('>', line); }
  void logWrite(const string& line) { append('<', line); }

  const string& getPath() const { return path; }

  static string expandPath(const string& pathTemplate);

 protected:
  void append(char direction, const string& line);

  string path;
  ofstream out;
  mutex logMutex;
};
}  // namespace imm

#endif  // __IMM_COMMUNICATION_LOG__

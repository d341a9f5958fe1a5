#ifndef __IMM_CHANNEL__
#define __IMM_CHANNEL__

#include "CommunicationLog.hpp"
#include "Errors.hpp"
#include "SocketHandler.hpp"

namespace imm {
/**
 * @brief One side's view of the two one-directional line streams that link
 * the peers: lines are read from readFd and written to writeFd.
 *
 * The descriptors can be pipes, stdio or a socket; both must already be
 * adopted by the SocketHandler.
 */
class Channel {
 public:
  /** @brief Lines starting with this marker are padding, not protocol. */
  static const char* NAIVE_FLUSH_MARKER;
  /** @brief Size the padding line is grown to, line break included. */
  static const int NAIVE_FLUSH_SIZE = 4096;

  Channel(shared_ptr<SocketHandler> _socketHandler, int _readFd, int _writeFd);

  /**
   * @brief Reads the next line without its line break.
   *
   * @param timeoutMs bound on the wait, or 0 to wait forever.
   * @return false on a clean end of stream.
   *
   * Throws ProtocolError TIMEOUT (and marks the channel unusable) when the
   * bound passes, and CHANNEL_CLOSED on a read error or when the stream ends
   * in the middle of a line.
   */
  bool readLine(string* line, int64_t timeoutMs);

  /**
   * @brief Writes all lines with a single write so a message is never split
   * across other writers. Throws ProtocolError CHANNEL_CLOSED on failure.
   */
  void writeLines(const vector<string>& lines);

  void writeLine(const string& line) { writeLines(vector<string>(1, line)); }

  /** @brief Redirects outgoing lines, e.g. to a communicator connection. */
  void setWriteFd(int fd) { writeFd = fd; }
  int getReadFd() const { return readFd; }
  int getWriteFd() const { return writeFd; }

  void setCommunicationLog(shared_ptr<CommunicationLog> log) {
    communicationLog = log;
  }
  /** @brief Drops naive-flush padding lines on read. */
  void setSkipFlushLines(bool skip) { skipFlushLines = skip; }
  /** @brief Appends a naive-flush padding line to every write. */
  void setPadWrites(bool pad) { padWrites = pad; }

  bool isUsable() const { return usable; }
  /** @brief No further reads or writes will be attempted. */
  void markUnusable() { usable = false; }

  /** @brief Closes the outgoing stream so the peer sees end of file. */
  void closeWrite();
  void closeRead();

  static bool isFlushLine(const string& line);

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int readFd;
  int writeFd;
  string buffer;
  bool eof;
  bool usable;
  bool skipFlushLines;
  bool padWrites;
  shared_ptr<CommunicationLog> communicationLog;
};
}  // namespace imm

#endif  // __IMM_CHANNEL__

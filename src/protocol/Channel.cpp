#include "Channel.hpp"

namespace imm {
const char* Channel::NAIVE_FLUSH_MARKER = "imm-naive-flush-line";

Channel::Channel(shared_ptr<SocketHandler> _socketHandler, int _readFd,
                 int _writeFd)
    : socketHandler(_socketHandler),
      readFd(_readFd),
      writeFd(_writeFd),
      eof(false),
      usable(true),
      skipFlushLines(false),
      padWrites(false) {}

bool Channel::isFlushLine(const string& line) {
  static const string marker = NAIVE_FLUSH_MARKER;
  if (line.compare(0, marker.size(), marker) != 0) {
    return false;
  }
  return line.find_first_not_of(' ', marker.size()) == string::npos;
}

bool Channel::readLine(string* line, int64_t timeoutMs) {
  if (!usable) {
    throw ProtocolError(ProtocolError::CHANNEL_CLOSED,
                        "read from an unusable channel");
  }
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (true) {
    size_t newline = buffer.find('\n');
    if (newline != string::npos) {
      *line = buffer.substr(0, newline);
      buffer.erase(0, newline + 1);
      if (skipFlushLines && isFlushLine(*line)) {
        VLOG(4) << "Skipped naive flush line";
        continue;
      }
      if (communicationLog.get()) {
        communicationLog->logRead(*line);
      }
      VLOG(4) << "Read line: " << *line;
      return true;
    }
    if (eof) {
      if (!buffer.empty()) {
        usable = false;
        throw ProtocolError(ProtocolError::CHANNEL_CLOSED,
                            "stream ended in the middle of a line");
      }
      return false;
    }

    if (timeoutMs > 0) {
      auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
                           deadline - std::chrono::steady_clock::now())
                           .count();
      if (remaining <= 0) {
        usable = false;
        throw ProtocolError(ProtocolError::TIMEOUT,
                            "no data from peer within " +
                                to_string(timeoutMs) + " ms");
      }
      if (!socketHandler->waitForData(readFd, remaining / 1000000,
                                      remaining % 1000000)) {
        continue;
      }
    }

    char buf[4096];
    ssize_t bytesRead = socketHandler->read(readFd, buf, sizeof(buf));
    if (bytesRead == 0) {
      VLOG(1) << "End of stream on fd " << readFd;
      eof = true;
    } else if (bytesRead < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      usable = false;
      throw ProtocolError(ProtocolError::CHANNEL_CLOSED,
                          string("read failed: ") + strerror(errno));
    } else {
      buffer.append(buf, bytesRead);
    }
  }
}

void Channel::writeLines(const vector<string>& lines) {
  if (!usable) {
    throw ProtocolError(ProtocolError::CHANNEL_CLOSED,
                        "write to an unusable channel");
  }
  string s;
  for (const auto& line : lines) {
    if (line.find('\n') != string::npos) {
      throw std::invalid_argument("Protocol lines cannot contain a line break");
    }
    s += line;
    s += '\n';
  }
  if (padWrites) {
    string flushLine = NAIVE_FLUSH_MARKER;
    flushLine.resize(NAIVE_FLUSH_SIZE - 1, ' ');
    s += flushLine;
    s += '\n';
  }
  try {
    socketHandler->writeAllOrThrow(writeFd, s.c_str(), s.length());
  } catch (const std::runtime_error& e) {
    usable = false;
    throw ProtocolError(ProtocolError::CHANNEL_CLOSED,
                        string("write failed: ") + e.what());
  }
  for (const auto& line : lines) {
    if (communicationLog.get()) {
      communicationLog->logWrite(line);
    }
    VLOG(4) << "Wrote line: " << line;
  }
}

void Channel::closeWrite() {
  if (writeFd >= 0) {
    socketHandler->close(writeFd);
    writeFd = -1;
  }
}

void Channel::closeRead() {
  if (readFd >= 0) {
    socketHandler->close(readFd);
    readFd = -1;
  }
}
}  // namespace imm

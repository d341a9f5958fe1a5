#ifndef __IMM_ERRORS__
#define __IMM_ERRORS__

#include "Headers.hpp"

namespace imm {
/**
 * @brief Raised by the token codec for a malformed token-list line.
 */
class DecodeError : public std::runtime_error {
 public:
  enum Kind {
    UNTERMINATED_NAME,
    BAD_ESCAPE,
    UNKNOWN_CATEGORY,
    INVALID_UTF8,
  };

  DecodeError(Kind _kind, const string& message, size_t _position)
      : std::runtime_error(string(kindName(_kind)) + ": " + message +
                           " (at offset " + to_string(_position) + ")"),
        kind(_kind),
        position(_position) {}

  Kind getKind() const { return kind; }

  /** @brief Offset of the offending unit in the decoded line. */
  size_t getPosition() const { return position; }

  static const char* kindName(Kind kind);

 protected:
  Kind kind;
  size_t position;
};

/**
 * @brief Raised when the two peers are out of sync. The session cannot be
 * used after one of these.
 */
class ProtocolError : public std::runtime_error {
 public:
  enum Kind {
    NO_OPEN_FRAME,
    HANDSHAKE_EXPECTED,
    UNEXPECTED_MESSAGE_KIND,
    TIMEOUT,
    CHANNEL_CLOSED,
    OUT_OF_TURN,
    SESSION_CLOSED,
    UNKNOWN_HANDLER,
  };

  ProtocolError(Kind _kind, const string& message,
                const string& _callSite = "")
      : std::runtime_error(
            string(kindName(_kind)) + ": " + message +
            (_callSite.empty() ? string() : " [in " + _callSite + "]")),
        kind(_kind),
        callSite(_callSite) {}

  Kind getKind() const { return kind; }

  /**
   * @brief The open frames at the point of failure, innermost first, or an
   * empty string when no call was in flight.
   */
  const string& getCallSite() const { return callSite; }

  static const char* kindName(Kind kind);

 protected:
  Kind kind;
  string callSite;
};

/**
 * @brief A handler body failed on one side and the failure travelled back to
 * the invoker as a value.
 *
 * The trace holds one `handler@side` entry per handler boundary the failure
 * crossed, innermost first.
 */
class RemoteFailure : public std::runtime_error {
 public:
  RemoteFailure(const string& _summary, const vector<string>& _trace)
      : std::runtime_error(render(_summary, _trace)),
        summary(_summary),
        trace(_trace) {}

  const string& getSummary() const { return summary; }
  const vector<string>& getTrace() const { return trace; }
  int getLevels() const { return int(trace.size()); }

 protected:
  string summary;
  vector<string> trace;

  static string render(const string& summary, const vector<string>& trace) {
    string s = summary;
    for (const auto& entry : trace) {
      s += "\n  in " + entry;
    }
    return s;
  }
};
}  // namespace imm

#endif  // __IMM_ERRORS__

#include "Errors.hpp"

namespace imm {
const char* DecodeError::kindName(Kind kind) {
  switch (kind) {
    case UNTERMINATED_NAME:
      return "UnterminatedName";
    case BAD_ESCAPE:
      return "BadEscape";
    case UNKNOWN_CATEGORY:
      return "UnknownCategory";
    case INVALID_UTF8:
      return "InvalidUtf8";
  }
  return "DecodeError";
}

const char* ProtocolError::kindName(Kind kind) {
  switch (kind) {
    case NO_OPEN_FRAME:
      return "NoOpenFrame";
    case HANDSHAKE_EXPECTED:
      return "HandshakeExpected";
    case UNEXPECTED_MESSAGE_KIND:
      return "UnexpectedMessageKind";
    case TIMEOUT:
      return "Timeout";
    case CHANNEL_CLOSED:
      return "ChannelClosed";
    case OUT_OF_TURN:
      return "OutOfTurn";
    case SESSION_CLOSED:
      return "SessionClosed";
    case UNKNOWN_HANDLER:
      return "UnknownHandler";
  }
  return "ProtocolError";
}
}  // namespace imm

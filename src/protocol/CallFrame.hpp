#ifndef __IMM_CALL_FRAME__
#define __IMM_CALL_FRAME__

#include "Headers.hpp"

namespace imm {
/**
 * @brief One in-flight invocation on a side's call stack.
 */
struct CallFrame {
  enum Direction {
    /** This side runs the handler; the peer waits for the return. */
    LOCAL,
    /** The peer runs the handler; this side waits for the return. */
    REMOTE,
  };

  string handlerName;
  Direction direction;
  /** Index of the frame suspended on this one, or -1 at top level. */
  int callerIndex;

  CallFrame(const string& _handlerName, Direction _direction, int _callerIndex)
      : handlerName(_handlerName),
        direction(_direction),
        callerIndex(_callerIndex) {}
};
}  // namespace imm

#endif  // __IMM_CALL_FRAME__

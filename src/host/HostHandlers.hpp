#ifndef __IMM_HOST_HANDLERS__
#define __IMM_HOST_HANDLERS__

#include "Handler.hpp"

namespace imm {
/**
 * @brief Registers the handlers imm-host offers to the Engine:
 *  - compute (line): integer arithmetic, see ExpressionEvaluator
 *  - echo (line): returns its argument
 *  - upper (line): returns its argument in ASCII upper case
 *  - tokens (token list): returns the number of tokens
 *  - count_lines (block): returns the number of lines
 */
void registerHostHandlers(HandlerTable* table);
}  // namespace imm

#endif  // __IMM_HOST_HANDLERS__

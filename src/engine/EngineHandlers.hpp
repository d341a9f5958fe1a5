#ifndef __IMM_ENGINE_HANDLERS__
#define __IMM_ENGINE_HANDLERS__

#include "Dispatcher.hpp"

namespace imm {
/**
 * @brief Registers the handlers of the reference engine:
 *  - double (line): twice an integer
 *  - square (line): asks the Process handler `compute` for n*n
 *  - echo (line): returns its argument
 *  - fail (line): fails with its argument as the message
 *  - tokens (token list): the number of tokens
 */
void registerEngineHandlers(HandlerTable* table);

/** @brief Parses a whole-line integer. Throws std::invalid_argument. */
int64_t parseInteger(const string& text);
}  // namespace imm

#endif  // __IMM_ENGINE_HANDLERS__

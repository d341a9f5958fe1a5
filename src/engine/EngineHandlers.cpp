#include "EngineHandlers.hpp"

namespace imm {
int64_t parseInteger(const string& text) {
  size_t used = 0;
  int64_t value;
  try {
    value = stoll(text, &used);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Not an integer: '" + text + "'");
  }
  if (used != text.size()) {
    throw std::invalid_argument("Not an integer: '" + text + "'");
  }
  return value;
}

void registerEngineHandlers(HandlerTable* table) {
  table->add("double", ArgumentKind::LINE,
             [](Dispatcher*, const Argument& arg) {
               int64_t doubled;
               if (__builtin_mul_overflow(parseInteger(arg.line), 2,
                                          &doubled)) {
                 throw std::overflow_error("Cannot double " + arg.line +
                                           " without overflowing");
               }
               return to_string(doubled);
             });
  table->add("square", ArgumentKind::LINE,
             [](Dispatcher* dispatcher, const Argument& arg) {
               int64_t n = parseInteger(arg.line);
               return dispatcher->invokeRemote(
                   "compute",
                   Argument::text(to_string(n) + "*" + to_string(n)));
             });
  table->add("echo", ArgumentKind::LINE,
             [](Dispatcher*, const Argument& arg) { return arg.line; });
  table->add("fail", ArgumentKind::LINE,
             [](Dispatcher*, const Argument& arg) -> string {
               throw std::runtime_error(arg.line);
             });
  table->add("tokens", ArgumentKind::TOKEN_LIST,
             [](Dispatcher*, const Argument& arg) {
               return to_string(arg.tokens.size());
             });
}
}  // namespace imm

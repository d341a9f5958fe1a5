#include "HostHandlers.hpp"

#include "ExpressionEvaluator.hpp"

namespace imm {
void registerHostHandlers(HandlerTable* table) {
  table->add("compute", ArgumentKind::LINE,
             [](Dispatcher*, const Argument& arg) {
               return to_string(ExpressionEvaluator::evaluate(arg.line));
             });
  table->add("echo", ArgumentKind::LINE,
             [](Dispatcher*, const Argument& arg) { return arg.line; });
  table->add("upper", ArgumentKind::LINE,
             [](Dispatcher*, const Argument& arg) {
               string s = arg.line;
               transform(s.begin(), s.end(), s.begin(),
                         [](unsigned char c) { return char(toupper(c)); });
               return s;
             });
  table->add("tokens", ArgumentKind::TOKEN_LIST,
             [](Dispatcher*, const Argument& arg) {
               return to_string(arg.tokens.size());
             });
  table->add("count_lines", ArgumentKind::BLOCK,
             [](Dispatcher*, const Argument& arg) {
               return to_string(arg.block.size());
             });
}
}  // namespace imm

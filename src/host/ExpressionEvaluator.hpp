#ifndef __IMM_EXPRESSION_EVALUATOR__
#define __IMM_EXPRESSION_EVALUATOR__

#include "Headers.hpp"

namespace imm {
/**
 * @brief Evaluates integer arithmetic with + - * /, unary minus and
 * parentheses. Division truncates toward zero.
 */
class ExpressionEvaluator {
 public:
  /**
   * @brief Throws std::invalid_argument on a syntax error,
   * std::domain_error on division by zero and std::overflow_error when a
   * result does not fit in 64 bits.
   */
  static int64_t evaluate(const string& expression);

 protected:
  explicit ExpressionEvaluator(const string& _text) : text(_text), pos(0) {}

  int64_t parseSum();
  int64_t parseProduct();
  int64_t parseFactor();
  void skipSpaces();

  const string& text;
  size_t pos;
};
}  // namespace imm

#endif  // __IMM_EXPRESSION_EVALUATOR__

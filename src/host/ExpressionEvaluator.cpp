#include "ExpressionEvaluator.hpp"

namespace imm {
namespace {
void checkedApply(char op, int64_t* value, int64_t rhs, const string& text) {
  bool overflow = false;
  switch (op) {
    case '+':
      overflow = __builtin_add_overflow(*value, rhs, value);
      break;
    case '-':
      overflow = __builtin_sub_overflow(*value, rhs, value);
      break;
    case '*':
      overflow = __builtin_mul_overflow(*value, rhs, value);
      break;
    case '/':
      if (rhs == 0) {
        throw std::domain_error("Division by zero in expression: " + text);
      }
      if (*value == std::numeric_limits<int64_t>::min() && rhs == -1) {
        overflow = true;
      } else {
        *value /= rhs;
      }
      break;
  }
  if (overflow) {
    throw std::overflow_error("Integer overflow in expression: " + text);
  }
}
}  // namespace

int64_t ExpressionEvaluator::evaluate(const string& expression) {
  ExpressionEvaluator evaluator(expression);
  int64_t value = evaluator.parseSum();
  evaluator.skipSpaces();
  if (evaluator.pos != expression.size()) {
    throw std::invalid_argument("Unexpected '" +
                                expression.substr(evaluator.pos, 1) +
                                "' in expression: " + expression);
  }
  return value;
}

void ExpressionEvaluator::skipSpaces() {
  while (pos < text.size() && isspace((unsigned char)text[pos])) {
    pos++;
  }
}

int64_t ExpressionEvaluator::parseSum() {
  int64_t value = parseProduct();
  while (true) {
    skipSpaces();
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      char op = text[pos++];
      int64_t rhs = parseProduct();
      checkedApply(op, &value, rhs, text);
    } else {
      return value;
    }
  }
}

int64_t ExpressionEvaluator::parseProduct() {
  int64_t value = parseFactor();
  while (true) {
    skipSpaces();
    if (pos < text.size() && (text[pos] == '*' || text[pos] == '/')) {
      char op = text[pos++];
      int64_t rhs = parseFactor();
      checkedApply(op, &value, rhs, text);
    } else {
      return value;
    }
  }
}

int64_t ExpressionEvaluator::parseFactor() {
  skipSpaces();
  if (pos >= text.size()) {
    throw std::invalid_argument("Expression ends too early: " + text);
  }
  if (text[pos] == '-') {
    pos++;
    int64_t value = parseFactor();
    if (value == std::numeric_limits<int64_t>::min()) {
      throw std::overflow_error("Integer overflow in expression: " + text);
    }
    return -value;
  }
  if (text[pos] == '(') {
    pos++;
    int64_t value = parseSum();
    skipSpaces();
    if (pos >= text.size() || text[pos] != ')') {
      throw std::invalid_argument("Missing ')' in expression: " + text);
    }
    pos++;
    return value;
  }
  size_t start = pos;
  while (pos < text.size() && isdigit((unsigned char)text[pos])) {
    pos++;
  }
  if (start == pos) {
    throw std::invalid_argument("Expected a number at '" + text.substr(pos) +
                                "' in expression: " + text);
  }
  try {
    return stoll(text.substr(start, pos - start));
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("Number too large in expression: " + text);
  }
}
}  // namespace imm

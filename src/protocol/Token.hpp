#ifndef __IMM_TOKEN__
#define __IMM_TOKEN__

#include "Headers.hpp"

namespace imm {
/**
 * @brief Category codes a character token can carry. The numeric values are
 * the engine's own category numbers and double as the wire markers.
 */
enum class Catcode : int {
  BEGIN_GROUP = 1,
  END_GROUP = 2,
  MATH_SHIFT = 3,
  ALIGNMENT_TAB = 4,
  PARAMETER = 6,
  SUPERSCRIPT = 7,
  SUBSCRIPT = 8,
  SPACE = 10,
  LETTER = 11,
  OTHER = 12,
  ACTIVE = 13,
};

/** @brief Returns true for the category numbers a Token may carry. */
bool isValidCatcode(int value);

/**
 * @brief An atomic symbolic unit: a character with a category, an active
 * character, a named control sequence, or the frozen no-op marker.
 *
 * A control sequence with an empty name is the null-name sentinel.
 */
class Token {
 public:
  enum Type {
    CHARACTER,
    ACTIVE_CHARACTER,
    CONTROL_SEQUENCE,
    FROZEN_RELAX,
  };

  /**
   * @brief Builds a character token. Throws std::invalid_argument for the
   * active category (use activeCharacter) or a code point out of range.
   */
  static Token character(Catcode catcode, char32_t ch);
  static Token activeCharacter(char32_t ch);
  static Token controlSequence(const u32string& name);
  /** @brief Convenience overload for ASCII or UTF-8 names. */
  static Token controlSequence(const string& utf8Name);
  static Token nullName() { return controlSequence(u32string()); }
  static Token frozenRelax();

  Type getType() const { return type; }

  /** @brief The category; CONTROL_SEQUENCE and FROZEN_RELAX report OTHER. */
  Catcode getCatcode() const { return catcode; }

  /** @brief The character for CHARACTER and ACTIVE_CHARACTER tokens. */
  char32_t getChar() const { return ch; }

  const u32string& getName() const { return name; }

  bool isControlSequence() const { return type == CONTROL_SEQUENCE; }
  bool isActive() const { return type == ACTIVE_CHARACTER; }
  bool isFrozenRelax() const { return type == FROZEN_RELAX; }
  bool isNullName() const { return type == CONTROL_SEQUENCE && name.empty(); }

  bool operator==(const Token& other) const;
  bool operator!=(const Token& other) const { return !(*this == other); }

  /** @brief Human-readable form used in logs and test failures. */
  string toString() const;

 protected:
  Token(Type _type, Catcode _catcode, char32_t _ch, const u32string& _name)
      : type(_type), catcode(_catcode), ch(_ch), name(_name) {}

  Type type;
  Catcode catcode;
  char32_t ch;
  u32string name;
};

typedef vector<Token> TokenList;

ostream& operator<<(ostream& os, const Token& token);
ostream& operator<<(ostream& os, const TokenList& tokens);
}  // namespace imm

#endif  // __IMM_TOKEN__

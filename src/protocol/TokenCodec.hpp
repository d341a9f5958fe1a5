#ifndef __IMM_TOKEN_CODEC__
#define __IMM_TOKEN_CODEC__

#include "Errors.hpp"
#include "Token.hpp"

namespace imm {
/**
 * @brief Serializes token lists to single newline-free lines and back.
 *
 * Every unit is self-delimiting:
 *  - a character token is its category marker (hex digit of the category)
 *    followed by the character, or `^` + marker + (character + 0x40) when the
 *    code point is below 32;
 *  - an active character uses marker `D` the same way;
 *  - a control sequence is one `*` for every name character below 33, then
 *    `\`, then the name with each such character written as a space followed
 *    by (character + 0x40), then a terminating space;
 *  - the frozen no-op marker is `R`.
 *
 * In byte mode a line carries one byte per code point, so code points above
 * 255 cannot be encoded. In unicode mode the line is UTF-8.
 */
class TokenCodec {
 public:
  explicit TokenCodec(bool _unicode) : unicode(_unicode) {}

  bool isUnicode() const { return unicode; }

  /**
   * @brief Encodes a token list to the bytes of one wire line (without the
   * line break). Throws std::invalid_argument when a code point cannot be
   * represented in byte mode.
   */
  string encode(const TokenList& tokens) const;

  /**
   * @brief Decodes one wire line. Throws DecodeError on malformed input.
   */
  TokenList decode(const string& line) const;

  /** @brief Encodes a single token to its code-point form. */
  static u32string encodeToken(const Token& token);
  static u32string encodeCodePoints(const TokenList& tokens);
  static TokenList decodeCodePoints(const u32string& data);

  /** @brief UTF-8 helpers. fromUtf8 throws DecodeError(INVALID_UTF8). */
  static string toUtf8(const u32string& s);
  static u32string fromUtf8(const string& s);

 protected:
  bool unicode;
};
}  // namespace imm

#endif  // __IMM_TOKEN_CODEC__

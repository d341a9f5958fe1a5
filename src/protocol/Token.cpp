#include "Token.hpp"

#include "TokenCodec.hpp"

namespace imm {
namespace {
const char32_t MAX_CODE_POINT = 0x10FFFF;

void checkCodePoint(char32_t ch) {
  if (ch > MAX_CODE_POINT) {
    throw std::invalid_argument("Code point out of range: " +
                                to_string(uint32_t(ch)));
  }
  if (ch >= 0xD800 && ch <= 0xDFFF) {
    throw std::invalid_argument("Surrogate code point " +
                                to_string(uint32_t(ch)) +
                                " is not a character");
  }
}
}  // namespace

bool isValidCatcode(int value) {
  switch (value) {
    case 1:
    case 2:
    case 3:
    case 4:
    case 6:
    case 7:
    case 8:
    case 10:
    case 11:
    case 12:
    case 13:
      return true;
    default:
      return false;
  }
}

Token Token::character(Catcode catcode, char32_t ch) {
  if (catcode == Catcode::ACTIVE) {
    throw std::invalid_argument(
        "Active characters are built with Token::activeCharacter");
  }
  if (!isValidCatcode(int(catcode))) {
    throw std::invalid_argument("Invalid category code: " +
                                to_string(int(catcode)));
  }
  checkCodePoint(ch);
  return Token(CHARACTER, catcode, ch, u32string());
}

Token Token::activeCharacter(char32_t ch) {
  checkCodePoint(ch);
  return Token(ACTIVE_CHARACTER, Catcode::ACTIVE, ch, u32string());
}

Token Token::controlSequence(const u32string& name) {
  for (char32_t c : name) {
    checkCodePoint(c);
  }
  return Token(CONTROL_SEQUENCE, Catcode::OTHER, 0, name);
}

Token Token::controlSequence(const string& utf8Name) {
  return controlSequence(TokenCodec::fromUtf8(utf8Name));
}

Token Token::frozenRelax() {
  return Token(FROZEN_RELAX, Catcode::OTHER, 0, u32string());
}

bool Token::operator==(const Token& other) const {
  if (type != other.type) {
    return false;
  }
  switch (type) {
    case CHARACTER:
      return catcode == other.catcode && ch == other.ch;
    case ACTIVE_CHARACTER:
      return ch == other.ch;
    case CONTROL_SEQUENCE:
      return name == other.name;
    case FROZEN_RELAX:
      return true;
  }
  return false;
}

string Token::toString() const {
  auto printable = [](char32_t c) -> string {
    if (c < 32 || c == 127) {
      return "^^" + string(1, char((c + 0x40) & 0x7F));
    }
    return TokenCodec::toUtf8(u32string(1, c));
  };
  switch (type) {
    case CHARACTER:
      return printable(ch) + "(" + to_string(int(catcode)) + ")";
    case ACTIVE_CHARACTER:
      return "~" + printable(ch);
    case CONTROL_SEQUENCE: {
      string s = "\\";
      for (char32_t c : name) {
        s += printable(c);
      }
      return isNullName() ? "\\csname\\endcsname" : s;
    }
    case FROZEN_RELAX:
      return "\\relax(frozen)";
  }
  return "?";
}

ostream& operator<<(ostream& os, const Token& token) {
  return os << token.toString();
}

ostream& operator<<(ostream& os, const TokenList& tokens) {
  os << "[";
  for (size_t a = 0; a < tokens.size(); a++) {
    if (a) {
      os << " ";
    }
    os << tokens[a];
  }
  return os << "]";
}
}  // namespace imm

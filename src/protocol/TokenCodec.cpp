#include "TokenCodec.hpp"

namespace imm {
namespace {
const char32_t ESCAPE_OFFSET = 0x40;
// Character tokens below this code point are caret-escaped
const char32_t CHAR_ESCAPE_LIMIT = 32;
// Control-sequence name characters below this code point are escaped
const char32_t NAME_ESCAPE_LIMIT = 33;

char32_t categoryMarker(Catcode catcode) {
  static const char* HEX = "0123456789ABCDEF";
  return char32_t(HEX[int(catcode)]);
}

int parseCategoryMarker(char32_t marker) {
  int value;
  if (marker >= U'0' && marker <= U'9') {
    value = int(marker - U'0');
  } else if (marker >= U'A' && marker <= U'F') {
    value = int(marker - U'A') + 10;
  } else {
    return -1;
  }
  return isValidCatcode(value) ? value : -1;
}

Token makeCharToken(int category, char32_t ch) {
  if (category == int(Catcode::ACTIVE)) {
    return Token::activeCharacter(ch);
  }
  return Token::character(Catcode(category), ch);
}
}  // namespace

u32string TokenCodec::encodeToken(const Token& token) {
  u32string out;
  switch (token.getType()) {
    case Token::CHARACTER:
    case Token::ACTIVE_CHARACTER: {
      char32_t marker = categoryMarker(token.getCatcode());
      char32_t ch = token.getChar();
      if (ch < CHAR_ESCAPE_LIMIT) {
        out += U'^';
        out += marker;
        out += ch + ESCAPE_OFFSET;
      } else {
        out += marker;
        out += ch;
      }
      break;
    }
    case Token::CONTROL_SEQUENCE: {
      const u32string& name = token.getName();
      for (char32_t c : name) {
        if (c < NAME_ESCAPE_LIMIT) {
          out += U'*';
        }
      }
      out += U'\\';
      for (char32_t c : name) {
        if (c < NAME_ESCAPE_LIMIT) {
          out += U' ';
          out += c + ESCAPE_OFFSET;
        } else {
          out += c;
        }
      }
      out += U' ';
      break;
    }
    case Token::FROZEN_RELAX:
      out += U'R';
      break;
  }
  return out;
}

u32string TokenCodec::encodeCodePoints(const TokenList& tokens) {
  u32string out;
  for (const auto& token : tokens) {
    out += encodeToken(token);
  }
  return out;
}

TokenList TokenCodec::decodeCodePoints(const u32string& data) {
  TokenList result;
  size_t i = 0;
  while (i < data.size()) {
    char32_t lead = data[i];
    if (lead == U'*' || lead == U'\\') {
      size_t stars = 0;
      while (i + stars < data.size() && data[i + stars] == U'*') {
        stars++;
      }
      size_t pos = i + stars;
      if (pos >= data.size() || data[pos] != U'\\') {
        throw DecodeError(DecodeError::BAD_ESCAPE,
                          "escape stars must be followed by a backslash", i);
      }
      pos++;
      u32string name;
      for (size_t s = 0; s < stars; s++) {
        size_t space = data.find(U' ', pos);
        if (space == u32string::npos) {
          throw DecodeError(DecodeError::UNTERMINATED_NAME,
                            "control sequence name never ends", i);
        }
        if (space + 1 >= data.size()) {
          throw DecodeError(DecodeError::BAD_ESCAPE,
                            "truncated escape in control sequence name",
                            space);
        }
        char32_t escaped = data[space + 1];
        if (escaped < ESCAPE_OFFSET ||
            escaped >= ESCAPE_OFFSET + NAME_ESCAPE_LIMIT) {
          throw DecodeError(DecodeError::BAD_ESCAPE,
                            "invalid escaped character in control sequence name",
                            space + 1);
        }
        name += data.substr(pos, space - pos);
        name += escaped - ESCAPE_OFFSET;
        pos = space + 2;
      }
      size_t end = data.find(U' ', pos);
      if (end == u32string::npos) {
        throw DecodeError(DecodeError::UNTERMINATED_NAME,
                          "control sequence name never ends", i);
      }
      name += data.substr(pos, end - pos);
      result.push_back(Token::controlSequence(name));
      i = end + 1;
    } else if (lead == U'R') {
      result.push_back(Token::frozenRelax());
      i++;
    } else if (lead == U'^') {
      if (i + 2 >= data.size()) {
        throw DecodeError(DecodeError::BAD_ESCAPE, "truncated caret escape", i);
      }
      int category = parseCategoryMarker(data[i + 1]);
      if (category < 0) {
        throw DecodeError(DecodeError::BAD_ESCAPE,
                          "caret escape without a category marker", i);
      }
      char32_t shifted = data[i + 2];
      if (shifted < ESCAPE_OFFSET ||
          shifted >= ESCAPE_OFFSET + CHAR_ESCAPE_LIMIT) {
        throw DecodeError(DecodeError::BAD_ESCAPE,
                          "caret escape carries a printable character", i);
      }
      result.push_back(makeCharToken(category, shifted - ESCAPE_OFFSET));
      i += 3;
    } else {
      int category = parseCategoryMarker(lead);
      if (category < 0) {
        throw DecodeError(DecodeError::UNKNOWN_CATEGORY,
                          "unknown category marker", i);
      }
      if (i + 1 >= data.size()) {
        throw DecodeError(DecodeError::BAD_ESCAPE,
                          "category marker without a character", i);
      }
      char32_t ch = data[i + 1];
      if (ch < CHAR_ESCAPE_LIMIT) {
        throw DecodeError(DecodeError::BAD_ESCAPE,
                          "raw control character must be caret-escaped", i + 1);
      }
      result.push_back(makeCharToken(category, ch));
      i += 2;
    }
  }
  return result;
}

string TokenCodec::encode(const TokenList& tokens) const {
  u32string data = encodeCodePoints(tokens);
  if (unicode) {
    return toUtf8(data);
  }
  string out;
  out.reserve(data.size());
  for (char32_t c : data) {
    if (c > 0xFF) {
      throw std::invalid_argument(
          "Code point " + to_string(uint32_t(c)) +
          " cannot be carried by a byte engine");
    }
    out += char(c);
  }
  return out;
}

TokenList TokenCodec::decode(const string& line) const {
  if (unicode) {
    return decodeCodePoints(fromUtf8(line));
  }
  u32string data;
  data.reserve(line.size());
  for (char c : line) {
    data += char32_t((unsigned char)c);
  }
  return decodeCodePoints(data);
}

string TokenCodec::toUtf8(const u32string& s) {
  std::wstring_convert<std::codecvt_utf8<char32_t>, char32_t> converter;
  try {
    return converter.to_bytes(s);
  } catch (const std::range_error&) {
    throw std::invalid_argument("Code point " +
                                to_string(converter.converted()) +
                                " of the line has no UTF-8 form");
  }
}

u32string TokenCodec::fromUtf8(const string& s) {
  std::wstring_convert<std::codecvt_utf8<char32_t>, char32_t> converter;
  u32string out;
  try {
    out = converter.from_bytes(s);
  } catch (const std::range_error&) {
    throw DecodeError(DecodeError::INVALID_UTF8, "invalid UTF-8 sequence",
                      converter.converted());
  }
  size_t offset = 0;
  for (char32_t c : out) {
    if (c >= 0xD800 && c <= 0xDFFF) {
      throw DecodeError(DecodeError::INVALID_UTF8, "invalid code point",
                        offset);
    }
    offset += c < 0x80 ? 1 : c < 0x800 ? 2 : c < 0x10000 ? 3 : 4;
  }
  return out;
}
}  // namespace imm

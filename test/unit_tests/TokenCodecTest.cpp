#include "TestHeaders.hpp"
#include "TokenCodec.hpp"

using namespace imm;

namespace {
TokenList everyKindOfToken() {
  TokenList tokens;
  const Catcode catcodes[] = {
      Catcode::BEGIN_GROUP, Catcode::END_GROUP,   Catcode::MATH_SHIFT,
      Catcode::ALIGNMENT_TAB, Catcode::PARAMETER, Catcode::SUPERSCRIPT,
      Catcode::SUBSCRIPT,   Catcode::SPACE,       Catcode::LETTER,
      Catcode::OTHER,
  };
  for (auto catcode : catcodes) {
    tokens.push_back(Token::character(catcode, U'a'));
    tokens.push_back(Token::character(catcode, U'^'));
  }
  for (char32_t c = 0; c < 32; c++) {
    tokens.push_back(Token::character(Catcode::OTHER, c));
    tokens.push_back(Token::activeCharacter(c));
  }
  tokens.push_back(Token::activeCharacter(U'~'));
  tokens.push_back(Token::character(Catcode::SPACE, U' '));
  tokens.push_back(Token::frozenRelax());
  tokens.push_back(Token::nullName());
  tokens.push_back(Token::controlSequence("relax"));
  tokens.push_back(Token::controlSequence(u32string(U"a\x01" U"b")));
  tokens.push_back(Token::controlSequence(u32string(U" ")));
  tokens.push_back(Token::controlSequence(u32string(U"\n\n")));
  tokens.push_back(Token::controlSequence("*"));
  tokens.push_back(Token::controlSequence("\\"));
  tokens.push_back(Token::character(Catcode::LETTER, U'\xff'));
  return tokens;
}
}  // namespace

TEST_CASE("Known encodings", "[TokenCodec]") {
  TokenCodec codec(false);
  REQUIRE(codec.encode({Token::character(Catcode::LETTER, U'a')}) == "Ba");
  REQUIRE(codec.encode({Token::character(Catcode::BEGIN_GROUP, U'{')}) ==
          "1{");
  REQUIRE(codec.encode({Token::character(Catcode::OTHER, U'\n')}) == "^CJ");
  REQUIRE(codec.encode({Token::activeCharacter(U'~')}) == "D~");
  REQUIRE(codec.encode({Token::activeCharacter(U'\x01')}) == "^DA");
  REQUIRE(codec.encode({Token::controlSequence("relax")}) == "\\relax ");
  REQUIRE(codec.encode({Token::frozenRelax()}) == "R");
  REQUIRE(codec.encode({Token::nullName()}) == "\\ ");
  REQUIRE(codec.encode({Token::controlSequence(u32string(U"a\x01" U"b"))}) ==
          "*\\a Ab ");
  REQUIRE(codec.encode({Token::controlSequence("a"),
                        Token::character(Catcode::SPACE, U' ')}) ==
          "\\a A ");
}

TEST_CASE("Every supported token round trips", "[TokenCodec]") {
  TokenList tokens = everyKindOfToken();

  SECTION("byte mode") {
    TokenCodec codec(false);
    string line = codec.encode(tokens);
    TokenList decoded = codec.decode(line);
    REQUIRE(decoded == tokens);
    REQUIRE(codec.encode(decoded) == line);
  }

  SECTION("unicode mode") {
    TokenCodec codec(true);
    tokens.push_back(Token::character(Catcode::LETTER, U'é'));
    tokens.push_back(Token::character(Catcode::OTHER, U'中'));
    tokens.push_back(Token::controlSequence(u32string(U"\U0001F600x")));
    string line = codec.encode(tokens);
    TokenList decoded = codec.decode(line);
    REQUIRE(decoded == tokens);
    REQUIRE(codec.encode(decoded) == line);
  }
}

TEST_CASE("Encoded lines never contain control bytes", "[TokenCodec]") {
  TokenCodec codec(false);
  string line = codec.encode(everyKindOfToken());
  for (char c : line) {
    REQUIRE((unsigned char)c >= 32);
  }
  REQUIRE(line.find('\n') == string::npos);
}

TEST_CASE("Control sequence with a low byte survives transport",
          "[TokenCodec]") {
  TokenCodec codec(true);
  TokenList tokens = {Token::controlSequence(u32string(U"x\x01")),
                      Token::character(Catcode::LETTER, U'y')};
  string line = codec.encode(tokens);
  REQUIRE(line.find('\x01') == string::npos);
  REQUIRE(line.find('\n') == string::npos);
  TokenList decoded = codec.decode(line);
  REQUIRE(decoded.size() == 2);
  REQUIRE(decoded[0].getName() == u32string(U"x\x01"));
  REQUIRE(decoded[1] == Token::character(Catcode::LETTER, U'y'));
}

TEST_CASE("Empty line decodes to an empty list", "[TokenCodec]") {
  TokenCodec codec(false);
  REQUIRE(codec.decode("").empty());
  REQUIRE(codec.encode(TokenList()) == "");
}

TEST_CASE("Malformed lines are rejected", "[TokenCodec]") {
  TokenCodec codec(false);
  auto kindOf = [&](const string& line) {
    try {
      codec.decode(line);
    } catch (const DecodeError& e) {
      return int(e.getKind());
    }
    return -1;
  };

  REQUIRE(kindOf("\\relax") == DecodeError::UNTERMINATED_NAME);
  REQUIRE(kindOf("Ba\\abc") == DecodeError::UNTERMINATED_NAME);
  REQUIRE(kindOf("*\\a") == DecodeError::UNTERMINATED_NAME);
  REQUIRE(kindOf("*\\a ") == DecodeError::BAD_ESCAPE);
  REQUIRE(kindOf("*\\a a ") == DecodeError::BAD_ESCAPE);
  REQUIRE(kindOf("**a ") == DecodeError::BAD_ESCAPE);
  REQUIRE(kindOf("^B") == DecodeError::BAD_ESCAPE);
  REQUIRE(kindOf("^ZA") == DecodeError::BAD_ESCAPE);
  REQUIRE(kindOf("^Ba") == DecodeError::BAD_ESCAPE);
  REQUIRE(kindOf("B") == DecodeError::BAD_ESCAPE);
  REQUIRE(kindOf("B\n") == DecodeError::BAD_ESCAPE);
  REQUIRE(kindOf("Za") == DecodeError::UNKNOWN_CATEGORY);
  REQUIRE(kindOf("5a") == DecodeError::UNKNOWN_CATEGORY);
  REQUIRE(kindOf("Bab") == DecodeError::UNKNOWN_CATEGORY);
}

TEST_CASE("Decode errors report the offending offset", "[TokenCodec]") {
  TokenCodec codec(false);
  try {
    codec.decode("BaBbZc");
    FAIL("decode should have thrown");
  } catch (const DecodeError& e) {
    REQUIRE(e.getKind() == DecodeError::UNKNOWN_CATEGORY);
    REQUIRE(e.getPosition() == 4);
  }
}

TEST_CASE("Byte engines cannot carry wide characters", "[TokenCodec]") {
  TokenCodec byteCodec(false);
  TokenList tokens = {Token::character(Catcode::LETTER, U'中')};
  REQUIRE_THROWS_AS(byteCodec.encode(tokens), std::invalid_argument);

  TokenCodec unicodeCodec(true);
  REQUIRE(unicodeCodec.decode(unicodeCodec.encode(tokens)) == tokens);
}

TEST_CASE("Invalid UTF-8 is rejected in unicode mode", "[TokenCodec]") {
  TokenCodec codec(true);
  REQUIRE_THROWS_AS(codec.decode("B\xc3"), DecodeError);
  REQUIRE_THROWS_AS(codec.decode("B\xff"), DecodeError);
  REQUIRE_THROWS_AS(codec.decode("B\xc0\x80"), DecodeError);
  // U+D800 written as if it were a character
  REQUIRE_THROWS_AS(codec.decode("B\xed\xa0\x80"), DecodeError);
  try {
    codec.decode("Ba\\x \xff");
    FAIL("decode should have thrown");
  } catch (const DecodeError& e) {
    REQUIRE(e.getKind() == DecodeError::INVALID_UTF8);
  }

  // The same bytes are plain latin-1 characters to a byte engine
  TokenCodec byteCodec(false);
  TokenList tokens = byteCodec.decode("B\xff");
  REQUIRE(tokens.size() == 1);
  REQUIRE(tokens[0].getChar() == U'\xff');
}

TEST_CASE("Token constructors validate their input", "[TokenCodec]") {
  REQUIRE_THROWS_AS(Token::character(Catcode::ACTIVE, U'a'),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(Token::character(Catcode(5), U'a'), std::invalid_argument);
  REQUIRE_THROWS_AS(Token::character(Catcode::LETTER, char32_t(0x110000)),
                    std::invalid_argument);
  REQUIRE(Token::nullName().isNullName());
  REQUIRE(Token::controlSequence("") == Token::nullName());
  REQUIRE(Token::activeCharacter(U'a') !=
          Token::character(Catcode::OTHER, U'a'));
  REQUIRE(Token::character(Catcode::LETTER, U'a') !=
          Token::character(Catcode::OTHER, U'a'));
}

TEST_CASE("Surrogates are not characters", "[TokenCodec]") {
  REQUIRE_THROWS_AS(Token::character(Catcode::LETTER, char32_t(0xD800)),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(Token::activeCharacter(char32_t(0xDFFF)),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(Token::controlSequence(u32string(1, char32_t(0xDC00))),
                    std::invalid_argument);

  // The code points around the surrogate range still travel intact
  TokenCodec codec(true);
  TokenList tokens = {Token::character(Catcode::LETTER, char32_t(0xD7FF)),
                      Token::character(Catcode::OTHER, char32_t(0xE000)),
                      Token::controlSequence(u32string(1, char32_t(0x10FFFF)))};
  REQUIRE(codec.decode(codec.encode(tokens)) == tokens);
}

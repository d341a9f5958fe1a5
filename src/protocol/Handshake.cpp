#include "Handshake.hpp"

namespace imm {
namespace {
const EngineProfile ENGINE_PROFILES[] = {
    {'p', "pdftex", false},
    {'x', "xetex", true},
    {'l', "luatex", true},
};
}  // namespace

const EngineProfile* Handshake::findProfile(char mark) {
  for (const auto& profile : ENGINE_PROFILES) {
    if (profile.mark == mark) {
      return &profile;
    }
  }
  return NULL;
}

string Handshake::buildIdentityLine(const SessionConfig& config) {
  if (findProfile(config.engineMark) == NULL) {
    throw std::invalid_argument(string("Unknown engine mark: ") +
                                config.engineMark);
  }
  return string(1, config.engineMark) + config.toTrailer();
}

SessionConfig Handshake::parseIdentityLine(const string& line) {
  if (line.empty()) {
    throw ProtocolError(ProtocolError::HANDSHAKE_EXPECTED,
                        "got an empty line instead of the identity line");
  }
  if (findProfile(line[0]) == NULL) {
    throw ProtocolError(ProtocolError::HANDSHAKE_EXPECTED,
                        "got '" + line.substr(0, 32) +
                            "' instead of the identity line");
  }
  SessionConfig config;
  if (line.length() > 1) {
    try {
      config = SessionConfig::fromTrailer(line.substr(1));
    } catch (const std::invalid_argument& e) {
      throw ProtocolError(ProtocolError::HANDSHAKE_EXPECTED, e.what());
    }
  }
  config.engineMark = line[0];
  return config;
}
}  // namespace imm

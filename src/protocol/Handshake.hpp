#ifndef __IMM_HANDSHAKE__
#define __IMM_HANDSHAKE__

#include "Errors.hpp"
#include "SessionConfig.hpp"

namespace imm {
/**
 * @brief Capability profile announced by an engine mark.
 */
struct EngineProfile {
  char mark;
  const char* name;
  /** Whether lines are UTF-8 (otherwise one byte per code point). */
  bool unicode;
};

/**
 * @brief Builds and parses the identity line: the engine mark followed by
 * the Base64 JSON session configuration.
 */
class Handshake {
 public:
  /** @brief Returns NULL for an unknown mark. */
  static const EngineProfile* findProfile(char mark);

  static string buildIdentityLine(const SessionConfig& config);

  /**
   * @brief Throws ProtocolError HANDSHAKE_EXPECTED when the line is not an
   * identity line.
   */
  static SessionConfig parseIdentityLine(const string& line);
};
}  // namespace imm

#endif  // __IMM_HANDSHAKE__

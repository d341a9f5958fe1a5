#ifndef __IMM_SESSION_CONFIG__
#define __IMM_SESSION_CONFIG__

#include "Headers.hpp"
#include "nlohmann/json.hpp"

namespace imm {
using json = nlohmann::json;

/**
 * @brief Settings of one bridge session. The Engine sends its copy to the
 * Process inside the identity line.
 */
struct SessionConfig {
  enum Driver {
    /** The Engine started the Process and issues the first call. */
    ENGINE,
    /** The Process started the Engine and issues the first call. */
    PROCESS,
  };

  char engineMark = 'p';
  Driver driver = ENGINE;
  /** Bound on a Process-side read in milliseconds, 0 for no bound. */
  int64_t timeoutMs = DEFAULT_READ_TIMEOUT_MS;
  int debugLevel = 0;
  bool naiveFlush = false;
  bool sanityCheckExtraLine = false;
  string communicationLogPath;
  /** Descriptor line of the communicator the Process writes through. */
  string communicator;

  json toJson() const;
  /** @brief Throws std::invalid_argument on a malformed document. */
  static SessionConfig fromJson(const json& j);

  /** @brief Base64 of the JSON document, safe to put on one line. */
  string toTrailer() const;
  static SessionConfig fromTrailer(const string& trailer);

  /**
   * @brief Overrides fields with the values of an INI file. Returns false if
   * the file cannot be loaded.
   */
  bool loadIniFile(const string& path);

  static const char* driverName(Driver driver);
  static Driver parseDriver(const string& name);
};
}  // namespace imm

#endif  // __IMM_SESSION_CONFIG__

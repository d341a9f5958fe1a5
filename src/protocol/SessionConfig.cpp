#include "SessionConfig.hpp"

#include "SimpleIni.h"
#include "base64.h"

namespace imm {
const char* SessionConfig::driverName(Driver driver) {
  return driver == ENGINE ? "engine" : "process";
}

SessionConfig::Driver SessionConfig::parseDriver(const string& name) {
  if (name == "engine") {
    return ENGINE;
  }
  if (name == "process") {
    return PROCESS;
  }
  throw std::invalid_argument("Unknown driver: " + name);
}

json SessionConfig::toJson() const {
  json j;
  j["version"] = PROTOCOL_VERSION;
  j["mark"] = string(1, engineMark);
  j["driver"] = driverName(driver);
  j["timeout_ms"] = timeoutMs;
  j["debug"] = debugLevel;
  j["naive_flush"] = naiveFlush;
  j["sanity_check_extra_line"] = sanityCheckExtraLine;
  j["communication_log"] = communicationLogPath;
  j["communicator"] = communicator;
  return j;
}

SessionConfig SessionConfig::fromJson(const json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("Session configuration must be an object");
  }
  SessionConfig config;
  try {
    if (j.contains("version") && j["version"].get<int>() != PROTOCOL_VERSION) {
      throw std::invalid_argument("Protocol version mismatch: peer speaks " +
                                  to_string(j["version"].get<int>()) +
                                  ", we speak " + to_string(PROTOCOL_VERSION));
    }
    if (j.contains("mark")) {
      string mark = j["mark"].get<string>();
      if (mark.length() != 1) {
        throw std::invalid_argument("Engine mark must be one character");
      }
      config.engineMark = mark[0];
    }
    if (j.contains("driver")) {
      config.driver = parseDriver(j["driver"].get<string>());
    }
    config.timeoutMs = j.value("timeout_ms", config.timeoutMs);
    config.debugLevel = j.value("debug", config.debugLevel);
    config.naiveFlush = j.value("naive_flush", config.naiveFlush);
    config.sanityCheckExtraLine =
        j.value("sanity_check_extra_line", config.sanityCheckExtraLine);
    config.communicationLogPath =
        j.value("communication_log", config.communicationLogPath);
    config.communicator = j.value("communicator", config.communicator);
  } catch (const json::exception& e) {
    throw std::invalid_argument(string("Bad session configuration: ") +
                                e.what());
  }
  return config;
}

string SessionConfig::toTrailer() const {
  string encoded;
  if (!Base64::Encode(toJson().dump(), &encoded)) {
    throw std::runtime_error("Could not base64-encode the configuration");
  }
  return encoded;
}

SessionConfig SessionConfig::fromTrailer(const string& trailer) {
  string decoded;
  if (!Base64::Decode(trailer, &decoded)) {
    throw std::invalid_argument("Configuration trailer is not base64");
  }
  json j;
  try {
    j = json::parse(decoded);
  } catch (const json::exception& e) {
    throw std::invalid_argument(string("Configuration trailer is not JSON: ") +
                                e.what());
  }
  return fromJson(j);
}

bool SessionConfig::loadIniFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(WARNING) << "Could not load config file " << path << ": " << rc;
    return false;
  }

  const char* timeout = ini.GetValue("Session", "timeout_ms", NULL);
  if (timeout) {
    timeoutMs = stoll(timeout);
  }
  naiveFlush = ini.GetBoolValue("Session", "naive_flush", naiveFlush);
  sanityCheckExtraLine = ini.GetBoolValue("Session", "sanity_check_extra_line",
                                          sanityCheckExtraLine);
  const char* logPath = ini.GetValue("Session", "communication_log", NULL);
  if (logPath) {
    communicationLogPath = string(logPath);
  }
  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    debugLevel = atoi(vlevel);
  }
  return true;
}
}  // namespace imm

#include "CommunicationLog.hpp"

namespace imm {
CommunicationLog::CommunicationLog(const string& pathTemplate)
    : path(expandPath(pathTemplate)) {
  out.open(path, ios::out | ios::trunc | ios::binary);
  if (!out.is_open()) {
    throw std::runtime_error("Could not open communication log " + path +
                             ": " + strerror(errno));
  }
  out << "# '>': read by this side, '<': written by this side" << endl;
  LOG(INFO) << "Logging protocol traffic to " << path;
}

string CommunicationLog::expandPath(const string& pathTemplate) {
  string s = pathTemplate;
  replaceAll(s, "$pid", to_string(::getpid()));
  return s;
}

void CommunicationLog::append(char direction, const string& line) {
  lock_guard<mutex> guard(logMutex);
  out << direction << line << "\n";
  out.flush();
}
}  // namespace imm

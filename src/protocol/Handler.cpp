#include "Handler.hpp"

namespace imm {
const char* argumentKindName(ArgumentKind kind) {
  switch (kind) {
    case ArgumentKind::NONE:
      return "none";
    case ArgumentKind::LINE:
      return "line";
    case ArgumentKind::TOKEN_LIST:
      return "token list";
    case ArgumentKind::BLOCK:
      return "block";
  }
  return "unknown";
}

void HandlerTable::add(const string& name, shared_ptr<Handler> handler) {
  if (name.empty() || name.find('\n') != string::npos) {
    throw std::invalid_argument("Invalid handler name: '" + name + "'");
  }
  if (!handler.get()) {
    throw std::invalid_argument("Null handler for " + name);
  }
  if (handlers.find(name) != handlers.end()) {
    throw std::invalid_argument("Handler registered twice: " + name);
  }
  handlers[name] = handler;
}

shared_ptr<Handler> HandlerTable::find(const string& name) const {
  auto it = handlers.find(name);
  if (it == handlers.end()) {
    return shared_ptr<Handler>();
  }
  return it->second;
}

vector<string> HandlerTable::names() const {
  vector<string> result;
  for (const auto& it : handlers) {
    result.push_back(it.first);
  }
  return result;
}
}  // namespace imm

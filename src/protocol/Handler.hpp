#ifndef __IMM_HANDLER__
#define __IMM_HANDLER__

#include "Token.hpp"

namespace imm {
class Dispatcher;

/**
 * @brief What follows an invoke line on the wire.
 */
enum class ArgumentKind {
  NONE,
  LINE,
  TOKEN_LIST,
  BLOCK,
};

const char* argumentKindName(ArgumentKind kind);

/**
 * @brief The argument of one invocation.
 */
struct Argument {
  ArgumentKind kind = ArgumentKind::NONE;
  string line;
  TokenList tokens;
  vector<string> block;

  static Argument none() { return Argument(); }
  static Argument text(const string& line) {
    Argument arg;
    arg.kind = ArgumentKind::LINE;
    arg.line = line;
    return arg;
  }
  static Argument tokenList(const TokenList& tokens) {
    Argument arg;
    arg.kind = ArgumentKind::TOKEN_LIST;
    arg.tokens = tokens;
    return arg;
  }
  static Argument lines(const vector<string>& block) {
    Argument arg;
    arg.kind = ArgumentKind::BLOCK;
    arg.block = block;
    return arg;
  }
};

/**
 * @brief Behavior bound to a handler name.
 *
 * call() runs synchronously on the dispatcher's thread. It may invoke the
 * peer through the dispatcher any number of times before it returns; the
 * returned string is sent back to the caller. Throwing reports a failure to
 * the caller.
 */
class Handler {
 public:
  virtual ~Handler() {}

  virtual ArgumentKind getArgumentKind() const = 0;

  virtual string call(Dispatcher* dispatcher, const Argument& argument) = 0;
};

/**
 * @brief Handler backed by a std::function.
 */
class FunctionHandler : public Handler {
 public:
  typedef function<string(Dispatcher*, const Argument&)> Body;

  FunctionHandler(ArgumentKind _argumentKind, Body _body)
      : argumentKind(_argumentKind), body(_body) {}

  virtual ArgumentKind getArgumentKind() const { return argumentKind; }

  virtual string call(Dispatcher* dispatcher, const Argument& argument) {
    return body(dispatcher, argument);
  }

 protected:
  ArgumentKind argumentKind;
  Body body;
};

/**
 * @brief Name to handler mapping, filled at startup.
 */
class HandlerTable {
 public:
  /**
   * @brief Registers a handler. Throws std::invalid_argument for an empty or
   * multi-line name, or a name that is already taken.
   */
  void add(const string& name, shared_ptr<Handler> handler);

  void add(const string& name, ArgumentKind argumentKind,
           FunctionHandler::Body body) {
    add(name, shared_ptr<Handler>(new FunctionHandler(argumentKind, body)));
  }

  /** @brief Returns an empty pointer for an unknown name. */
  shared_ptr<Handler> find(const string& name) const;

  bool contains(const string& name) const {
    return handlers.find(name) != handlers.end();
  }

  /** @brief All names, sorted. */
  vector<string> names() const;

  size_t size() const { return handlers.size(); }

 protected:
  map<string, shared_ptr<Handler>> handlers;
};
}  // namespace imm

#endif  // __IMM_HANDLER__

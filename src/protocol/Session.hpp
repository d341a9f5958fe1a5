#ifndef __IMM_SESSION__
#define __IMM_SESSION__

#include "BlockProtocol.hpp"
#include "Handshake.hpp"
#include "TokenCodec.hpp"

namespace imm {
/**
 * @brief The single context object of a bridge session: the channel pair,
 * the negotiated configuration, the lifecycle status and the turn.
 *
 * Only one side may be writing at any instant. A side gets the turn by
 * reading from its peer and gives it away by sending.
 */
class Session {
 public:
  enum Side {
    PROCESS,
    ENGINE,
  };

  enum Status {
    WAITING,
    RUNNING,
    ERROR,
    EXITED,
  };

  Session(Side _side, shared_ptr<Channel> _channel,
          const SessionConfig& _config);

  /**
   * @brief Engine side of the handshake: sends the identity line.
   */
  void announce();

  /**
   * @brief Process side of the handshake: reads the identity line and adopts
   * the engine mark, driver, naive-flush setting and communicator from it.
   * Throws ProtocolError HANDSHAKE_EXPECTED on anything else.
   */
  void acceptIdentity();

  /**
   * @brief Sends one message. Throws OUT_OF_TURN when the peer holds the
   * turn and SESSION_CLOSED when the session is no longer running.
   */
  void send(const vector<string>& lines);

  /**
   * @brief Reads one line, bounded by the configured timeout on the Process
   * side. Returns false on end of stream. Any ProtocolError fails the
   * session before it propagates.
   */
  bool readLine(string* line);

  vector<string> readBlock();

  /** @brief Marks the session failed and the channel unusable. */
  void fail();

  /**
   * @brief Ends the session, closes the outgoing stream and runs the
   * on-close callbacks. Calling it again does nothing.
   */
  void close();

  /** @brief Registers a callback run once by close(). */
  void addOnClose(function<void()> callback) {
    onCloseCallbacks.push_back(callback);
  }

  /** @brief Throws SESSION_CLOSED unless the session is running. */
  void checkUsable() const;

  Side getSide() const { return side; }
  Side getPeerSide() const { return side == PROCESS ? ENGINE : PROCESS; }
  Status getStatus() const { return status; }
  bool hasTurn() const { return turn; }
  const SessionConfig& getConfig() const { return config; }
  char getEngineMark() const { return config.engineMark; }
  bool isUnicode() const;
  const TokenCodec& getCodec() const { return codec; }
  shared_ptr<Channel> getChannel() { return channel; }

  static const char* sideName(Side side);
  static const char* statusName(Status status);

 protected:
  void applyConfig();
  int64_t readTimeoutMs() const;

  Side side;
  shared_ptr<Channel> channel;
  SessionConfig config;
  Status status;
  bool turn;
  bool closed;
  TokenCodec codec;
  vector<function<void()>> onCloseCallbacks;
};
}  // namespace imm

#endif  // __IMM_SESSION__

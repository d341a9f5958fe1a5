#ifndef __IMM_BLOCK_PROTOCOL__
#define __IMM_BLOCK_PROTOCOL__

#include "Channel.hpp"

namespace imm {
/**
 * @brief Frames a multi-line payload between two identical delimiter lines.
 *
 * Payload lines are carried byte for byte, trailing whitespace and empty
 * lines included.
 */
class BlockProtocol {
 public:
  /**
   * @brief Returns a random delimiter that occurs in none of the lines.
   */
  static string chooseDelimiter(const vector<string>& lines);

  /**
   * @brief Returns delimiter, payload and delimiter again. Throws
   * std::invalid_argument when a payload line contains a line break.
   */
  static vector<string> frame(const vector<string>& lines);

  static void sendBlock(Channel* channel, const vector<string>& lines);

  /**
   * @brief Reads one framed block. Throws ProtocolError CHANNEL_CLOSED when
   * the stream ends before the closing delimiter.
   */
  static vector<string> receiveBlock(Channel* channel, int64_t timeoutMs);
};
}  // namespace imm

#endif  // __IMM_BLOCK_PROTOCOL__

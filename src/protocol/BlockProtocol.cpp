#include "BlockProtocol.hpp"

namespace imm {
string BlockProtocol::chooseDelimiter(const vector<string>& lines) {
  while (true) {
    string delimiter = genRandomAlphaNum(BLOCK_DELIMITER_LENGTH);
    bool clash = false;
    for (const auto& line : lines) {
      if (line.find(delimiter) != string::npos) {
        clash = true;
        break;
      }
    }
    if (!clash) {
      return delimiter;
    }
    VLOG(1) << "Delimiter clashed with the payload, picking another";
  }
}

vector<string> BlockProtocol::frame(const vector<string>& lines) {
  for (const auto& line : lines) {
    if (line.find('\n') != string::npos) {
      throw std::invalid_argument(
          "Block lines cannot contain a line break; split them first");
    }
  }
  string delimiter = chooseDelimiter(lines);
  vector<string> framed;
  framed.reserve(lines.size() + 2);
  framed.push_back(delimiter);
  framed.insert(framed.end(), lines.begin(), lines.end());
  framed.push_back(delimiter);
  return framed;
}

void BlockProtocol::sendBlock(Channel* channel, const vector<string>& lines) {
  channel->writeLines(frame(lines));
}

vector<string> BlockProtocol::receiveBlock(Channel* channel,
                                           int64_t timeoutMs) {
  string delimiter;
  if (!channel->readLine(&delimiter, timeoutMs)) {
    throw ProtocolError(ProtocolError::CHANNEL_CLOSED,
                        "stream ended before a block started");
  }
  vector<string> lines;
  while (true) {
    string line;
    if (!channel->readLine(&line, timeoutMs)) {
      throw ProtocolError(ProtocolError::CHANNEL_CLOSED,
                          "stream ended inside a block (" +
                              to_string(lines.size()) + " lines read)");
    }
    if (line == delimiter) {
      return lines;
    }
    lines.push_back(line);
  }
}
}  // namespace imm

#pragma once

#include <functional>
#include <string>
#include <vector>

struct ChatMessage {
  std::string role;  // "system" or "user"
  std::string content;
};

// The language-generation capability: prompt messages in, free text out.
// Throwing means the capability itself failed (unreachable, crashed).
using GenerateFn = std::function<std::string(const std::vector<ChatMessage>&)>;

// Serialized as {"messages":[{"role":...,"content":...}]}.
std::string format_messages_json(const std::vector<ChatMessage>& messages);

// Runs `command` through the shell with the serialized messages on stdin and
// returns its stdout. Throws std::runtime_error on spawn failure or non-zero exit.
GenerateFn make_command_generator(const std::string& command);

// Replays recorded replies in order; once exhausted every call returns "".
GenerateFn make_replay_generator(std::vector<std::string> replies);

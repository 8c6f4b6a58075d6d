#pragma once

#include "cowork/providers/traits.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cowork::agent {

/// Keeps a prefix and a suffix of `text` totalling at most `max_chars` bytes, joined by a
/// `... [truncated N chars] ...` marker. Text within the limit is returned unchanged.
[[nodiscard]] std::string truncate_result(const std::string &text, std::size_t max_chars);

/// Role-tagged conversation owned by one session. Oldest entries are evicted once the
/// total content size exceeds the budget; the newest entry always survives.
class ConversationHistory {
public:
  explicit ConversationHistory(std::size_t max_chars = 64000);

  void append(providers::ChatMessage message);
  void append_user(std::string content);
  void append_assistant(std::string content);
  void append_tool(std::string content);

  [[nodiscard]] const std::vector<providers::ChatMessage> &messages() const { return messages_; }
  [[nodiscard]] std::size_t size() const { return messages_.size(); }
  [[nodiscard]] bool empty() const { return messages_.empty(); }
  [[nodiscard]] std::size_t total_chars() const { return total_chars_; }
  [[nodiscard]] std::size_t evicted() const { return evicted_; }

  /// Plain-text transcript used as planning context.
  [[nodiscard]] std::string render() const;
  void clear();

private:
  void enforce_budget();

  std::size_t max_chars_;
  std::vector<providers::ChatMessage> messages_;
  std::size_t total_chars_ = 0;
  std::size_t evicted_ = 0;
};

} // namespace cowork::agent

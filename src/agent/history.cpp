#include "cowork/agent/history.hpp"

#include <algorithm>

namespace cowork::agent {

namespace {

bool is_continuation_byte(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

} // namespace

std::string truncate_result(const std::string &text, const std::size_t max_chars) {
  // At least one character survives on each side of the marker.
  const std::size_t budget = std::max<std::size_t>(max_chars, 2);
  if (text.size() <= budget) {
    return text;
  }
  std::size_t head = budget / 2;
  std::size_t tail_start = text.size() - (budget - head);
  // Never split a UTF-8 sequence.
  while (head > 0 && is_continuation_byte(text[head])) {
    --head;
  }
  if (head == 0) {
    head = 1;
    while (head < text.size() && is_continuation_byte(text[head])) {
      ++head;
    }
  }
  while (tail_start < text.size() && is_continuation_byte(text[tail_start])) {
    ++tail_start;
  }
  if (tail_start == text.size()) {
    --tail_start;
    while (tail_start > head && is_continuation_byte(text[tail_start])) {
      --tail_start;
    }
  }
  if (tail_start <= head) {
    return text;
  }
  const std::size_t dropped = tail_start - head;
  return text.substr(0, head) + "\n... [truncated " + std::to_string(dropped) + " chars] ...\n" +
         text.substr(tail_start);
}

ConversationHistory::ConversationHistory(const std::size_t max_chars) : max_chars_(max_chars) {}

void ConversationHistory::append(providers::ChatMessage message) {
  total_chars_ += message.content.size();
  messages_.push_back(std::move(message));
  enforce_budget();
}

void ConversationHistory::append_user(std::string content) {
  append(providers::ChatMessage::user(std::move(content)));
}

void ConversationHistory::append_assistant(std::string content) {
  append(providers::ChatMessage::assistant(std::move(content)));
}

void ConversationHistory::append_tool(std::string content) {
  append(providers::ChatMessage::tool(std::move(content)));
}

std::string ConversationHistory::render() const {
  std::string out;
  for (const auto &message : messages_) {
    out += message.role + ": " + message.content + "\n";
  }
  return out;
}

void ConversationHistory::clear() {
  messages_.clear();
  total_chars_ = 0;
}

void ConversationHistory::enforce_budget() {
  std::size_t drop = 0;
  while (total_chars_ > max_chars_ && messages_.size() - drop > 1) {
    total_chars_ -= messages_[drop].content.size();
    ++drop;
  }
  if (drop > 0) {
    messages_.erase(messages_.begin(), messages_.begin() + static_cast<std::ptrdiff_t>(drop));
    evicted_ += drop;
  }
}

} // namespace cowork::agent

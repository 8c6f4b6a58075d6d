#include "cowork/providers/anthropic.hpp"

#include "cowork/common/json_util.hpp"

#include <sstream>

namespace cowork::providers {

namespace {

constexpr std::uint64_t kRequestTimeoutMs = 120'000;

common::Result<std::string> invalid_response(const std::string &detail) {
  return common::Result<std::string>::failure(
      ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = detail}.to_string());
}

} // namespace

AnthropicProvider::AnthropicProvider(std::string api_key, std::shared_ptr<HttpClient> http_client,
                                     std::string base_url)
    : api_key_(std::move(api_key)), http_client_(std::move(http_client)),
      base_url_(std::move(base_url)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string AnthropicProvider::build_body(const ChatRequest &request, const bool stream) const {
  std::ostringstream body;
  body << "{\"model\":" << common::json_quote(request.model) << ",\"max_tokens\":" << kMaxTokens;
  if (!request.preamble.empty()) {
    body << ",\"system\":" << common::json_quote(request.preamble);
  }
  body << ",\"messages\":[";
  // The messages API rejects consecutive turns with the same role, so adjacent ones are merged.
  std::vector<ChatMessage> merged;
  for (const auto &message : request.history) {
    const std::string role = message.role == "assistant" ? "assistant" : "user";
    if (!merged.empty() && merged.back().role == role) {
      merged.back().content += "\n\n" + message.content;
    } else {
      merged.push_back({role, message.content});
    }
  }
  for (std::size_t i = 0; i < merged.size(); ++i) {
    if (i > 0) {
      body << ',';
    }
    body << "{\"role\":\"" << merged[i].role
         << "\",\"content\":" << common::json_quote(merged[i].content) << "}";
  }
  body << "],\"temperature\":" << request.temperature;
  if (stream) {
    body << ",\"stream\":true";
  }
  body << "}";
  return body.str();
}

std::unordered_map<std::string, std::string> AnthropicProvider::build_headers(const bool stream) const {
  std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"anthropic-version", "2023-06-01"},
      {"x-api-key", api_key_},
  };
  if (stream) {
    headers["Accept"] = "text/event-stream";
  }
  return headers;
}

std::string AnthropicProvider::messages_url() const { return base_url_ + "/v1/messages"; }

common::Result<std::string> AnthropicProvider::chat(const ChatRequest &request) {
  if (api_key_.empty()) {
    return common::Result<std::string>::failure(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}.to_string());
  }
  const auto response = http_client_->post_json(messages_url(), build_headers(false),
                                                build_body(request, false), kRequestTimeoutMs);
  if (auto status = validate_http_response(response); !status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }
  const auto parsed = is_sse_response(response) ? parse_anthropic_sse_content(response.body)
                                                : parse_anthropic_content(response.body);
  if (!parsed.ok()) {
    return invalid_response(parsed.error());
  }
  return parsed;
}

common::Result<std::string> AnthropicProvider::stream(const ChatRequest &request,
                                                      const StreamChunkCallback &on_chunk) {
  if (api_key_.empty()) {
    return common::Result<std::string>::failure(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}.to_string());
  }

  std::string aggregated;
  std::string line_buffer;
  std::string event_data;
  const auto stream_handler = [&](const std::string_view bytes) {
    parse_sse_bytes(bytes, line_buffer, event_data, [&](const std::string &event) {
      auto delta = parse_anthropic_sse_event_delta(event);
      if (!delta.ok() || delta.value().empty()) {
        return;
      }
      aggregated += delta.value();
      if (on_chunk) {
        on_chunk(delta.value());
      }
    });
  };

  const auto response = http_client_->post_json_stream(
      messages_url(), build_headers(true), build_body(request, true), kRequestTimeoutMs,
      stream_handler);
  stream_handler("\n\n");

  if (auto status = validate_http_response(response); !status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }
  if (is_sse_response(response)) {
    if (!aggregated.empty()) {
      return common::Result<std::string>::success(aggregated);
    }
    const auto parsed = parse_anthropic_sse_content(response.body);
    if (!parsed.ok()) {
      return invalid_response(parsed.error());
    }
    return parsed;
  }

  const auto parsed = parse_anthropic_content(response.body);
  if (!parsed.ok()) {
    return invalid_response(parsed.error());
  }
  if (on_chunk && !parsed.value().empty()) {
    on_chunk(parsed.value());
  }
  return parsed;
}

std::string AnthropicProvider::name() const { return "anthropic"; }

} // namespace cowork::providers

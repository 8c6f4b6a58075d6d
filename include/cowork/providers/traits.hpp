#pragma once

#include "cowork/common/result.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cowork::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
};

/// Role is `user`, `assistant` or `tool`. Tool turns are sent to the model as user turns.
struct ChatMessage {
  std::string role;
  std::string content;

  [[nodiscard]] static ChatMessage user(std::string content) { return {"user", std::move(content)}; }
  [[nodiscard]] static ChatMessage assistant(std::string content) {
    return {"assistant", std::move(content)};
  }
  [[nodiscard]] static ChatMessage tool(std::string content) { return {"tool", std::move(content)}; }
};

/// One completion call. `history` ends with the turn to answer.
struct ChatRequest {
  std::string preamble;
  std::vector<ChatMessage> history;
  std::string model;
  double temperature = 0.7;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

using StreamChunkCallback = std::function<void(std::string_view)>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse
  post_json_stream(const std::string &url,
                   const std::unordered_map<std::string, std::string> &headers,
                   const std::string &body, std::uint64_t timeout_ms,
                   const StreamChunkCallback &on_chunk) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse
  post_json_stream(const std::string &url,
                   const std::unordered_map<std::string, std::string> &headers,
                   const std::string &body, std::uint64_t timeout_ms,
                   const StreamChunkCallback &on_chunk) override;
};

/// Completion provider. Given a preamble and a history it returns the assistant text.
class Provider {
public:
  virtual ~Provider() = default;

  [[nodiscard]] virtual common::Result<std::string> chat(const ChatRequest &request) = 0;

  /// Forwards text deltas to `on_chunk` and returns the full text. The default streams the
  /// non-streaming answer as a single chunk.
  [[nodiscard]] virtual common::Result<std::string> stream(const ChatRequest &request,
                                                           const StreamChunkCallback &on_chunk) {
    auto result = chat(request);
    if (result.ok() && on_chunk && !result.value().empty()) {
      on_chunk(result.value());
    }
    return result;
  }

  [[nodiscard]] virtual std::string name() const = 0;
};

/// Cheap model used for routing decisions.
[[nodiscard]] std::string fast_model(const std::string &provider);

[[nodiscard]] common::Result<std::string> parse_openai_content(const std::string &response);
[[nodiscard]] common::Result<std::string> parse_anthropic_content(const std::string &response);
[[nodiscard]] common::Result<std::string> parse_openai_sse_event_delta(const std::string &event_data);
[[nodiscard]] common::Result<std::string> parse_openai_sse_content(const std::string &response);
[[nodiscard]] common::Result<std::string>
parse_anthropic_sse_event_delta(const std::string &event_data);
[[nodiscard]] common::Result<std::string> parse_anthropic_sse_content(const std::string &response);

/// Incremental SSE framing: appends `chunk` and reports each completed `data:` payload.
void parse_sse_bytes(std::string_view chunk, std::string &line_buffer, std::string &event_data,
                     const std::function<void(const std::string &)> &on_event_data);

/// Maps HTTP failures to ProviderError text.
[[nodiscard]] common::Status validate_http_response(const HttpResponse &response);
[[nodiscard]] bool is_sse_response(const HttpResponse &response);

} // namespace cowork::providers

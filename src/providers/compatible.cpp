#include "cowork/providers/compatible.hpp"

#include "cowork/common/json_util.hpp"

#include <sstream>

namespace cowork::providers {

namespace {

constexpr std::uint64_t kRequestTimeoutMs = 120'000;

common::Result<std::string> invalid_response(const std::string &detail) {
  return common::Result<std::string>::failure(
      ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = detail}.to_string());
}

std::string wire_role(const std::string &role) { return role == "assistant" ? "assistant" : "user"; }

} // namespace

CompatibleProvider::CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                                       std::shared_ptr<HttpClient> http_client,
                                       const bool require_api_key,
                                       std::unordered_map<std::string, std::string> extra_headers)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), require_api_key_(require_api_key),
      extra_headers_(std::move(extra_headers)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string CompatibleProvider::build_body(const ChatRequest &request, const bool stream) const {
  std::ostringstream body;
  body << "{\"model\":" << common::json_quote(request.model) << ",\"messages\":[";
  bool first = true;
  if (!request.preamble.empty()) {
    body << "{\"role\":\"system\",\"content\":" << common::json_quote(request.preamble) << "}";
    first = false;
  }
  for (const auto &message : request.history) {
    if (!first) {
      body << ',';
    }
    first = false;
    body << "{\"role\":\"" << wire_role(message.role)
         << "\",\"content\":" << common::json_quote(message.content) << "}";
  }
  body << "],\"temperature\":" << request.temperature;
  body << ",\"stream\":" << (stream ? "true" : "false") << "}";
  return body.str();
}

std::unordered_map<std::string, std::string> CompatibleProvider::build_headers(const bool stream) const {
  std::unordered_map<std::string, std::string> headers = {{"Content-Type", "application/json"}};
  if (stream) {
    headers["Accept"] = "text/event-stream";
  }
  if (!api_key_.empty()) {
    headers["Authorization"] = "Bearer " + api_key_;
  }
  for (const auto &[key, value] : extra_headers_) {
    headers[key] = value;
  }
  return headers;
}

std::string CompatibleProvider::completions_url() const { return base_url_ + "/chat/completions"; }

common::Status CompatibleProvider::check_key() const {
  if (require_api_key_ && api_key_.empty()) {
    return common::Status::error(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}.to_string());
  }
  return common::Status::success();
}

common::Result<std::string> CompatibleProvider::chat(const ChatRequest &request) {
  if (auto key = check_key(); !key.ok()) {
    return common::Result<std::string>::failure(key.error());
  }
  const auto response = http_client_->post_json(completions_url(), build_headers(false),
                                                build_body(request, false), kRequestTimeoutMs);
  if (auto status = validate_http_response(response); !status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }
  const auto parsed =
      is_sse_response(response) ? parse_openai_sse_content(response.body)
                                : parse_openai_content(response.body);
  if (!parsed.ok()) {
    return invalid_response(parsed.error());
  }
  return parsed;
}

common::Result<std::string> CompatibleProvider::stream(const ChatRequest &request,
                                                       const StreamChunkCallback &on_chunk) {
  if (auto key = check_key(); !key.ok()) {
    return common::Result<std::string>::failure(key.error());
  }

  std::string aggregated;
  std::string line_buffer;
  std::string event_data;
  const auto stream_handler = [&](const std::string_view bytes) {
    parse_sse_bytes(bytes, line_buffer, event_data, [&](const std::string &event) {
      auto delta = parse_openai_sse_event_delta(event);
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
      completions_url(), build_headers(true), build_body(request, true), kRequestTimeoutMs,
      stream_handler);
  stream_handler("\n\n");

  if (auto status = validate_http_response(response); !status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }
  if (is_sse_response(response)) {
    if (!aggregated.empty()) {
      return common::Result<std::string>::success(aggregated);
    }
    const auto parsed = parse_openai_sse_content(response.body);
    if (!parsed.ok()) {
      return invalid_response(parsed.error());
    }
    return parsed;
  }

  // Server ignored the stream flag and answered with a plain completion.
  const auto parsed = parse_openai_content(response.body);
  if (!parsed.ok()) {
    return invalid_response(parsed.error());
  }
  if (on_chunk && !parsed.value().empty()) {
    on_chunk(parsed.value());
  }
  return parsed;
}

std::string CompatibleProvider::name() const { return name_; }

} // namespace cowork::providers

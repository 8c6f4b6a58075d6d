#include "cowork/providers/traits.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/common/json_util.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <sstream>

namespace cowork::providers {

namespace {

constexpr const char *kUserAgent = "cowork/0.1";

struct WriteContext {
  std::string *output = nullptr;
  const StreamChunkCallback *on_chunk = nullptr;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<WriteContext *>(userdata);
  if (context->output != nullptr) {
    context->output->append(ptr, total);
  }
  if (context->on_chunk != nullptr && *context->on_chunk) {
    (*context->on_chunk)(std::string_view(ptr, total));
  }
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  const std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);
  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    (*headers)[common::to_lower(common::trim(header.substr(0, separator)))] =
        common::trim(header.substr(separator + 1));
  }
  return total;
}

HttpResponse execute_request(const std::string &url,
                             const std::unordered_map<std::string, std::string> &headers,
                             const std::string &body, const std::uint64_t timeout_ms,
                             const StreamChunkCallback *on_chunk) {
  HttpResponse response;
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  WriteContext context{.output = &response.body, .on_chunk = on_chunk};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

std::vector<std::string> extract_sse_data_events(const std::string &response) {
  std::vector<std::string> events;
  std::string line_buffer;
  std::string event_data;
  parse_sse_bytes(response, line_buffer, event_data,
                  [&](const std::string &event) { events.push_back(event); });
  parse_sse_bytes("\n\n", line_buffer, event_data,
                  [&](const std::string &event) { events.push_back(event); });
  return events;
}

bool has_empty_string_field(const std::string &json, const std::string &field) {
  return json.find("\"" + field + "\":\"\"") != std::string::npos ||
         json.find("\"" + field + "\": \"\"") != std::string::npos;
}

} // namespace

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "Provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::AuthError:
    stream << "auth";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url,
                                       const std::unordered_map<std::string, std::string> &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return execute_request(url, headers, body, timeout_ms, nullptr);
}

HttpResponse CurlHttpClient::post_json_stream(
    const std::string &url, const std::unordered_map<std::string, std::string> &headers,
    const std::string &body, const std::uint64_t timeout_ms, const StreamChunkCallback &on_chunk) {
  return execute_request(url, headers, body, timeout_ms, &on_chunk);
}

std::string fast_model(const std::string &provider) {
  const std::string name = common::to_lower(provider);
  if (name == "gemini") {
    return "gemini-2.0-flash";
  }
  if (name == "anthropic") {
    return "claude-3-haiku-20240307";
  }
  return "gpt-4o-mini";
}

common::Result<std::string> parse_openai_content(const std::string &response) {
  if (response.find("\"choices\"") == std::string::npos) {
    return common::Result<std::string>::failure("choices field missing");
  }
  const std::string message = common::json_get_object(response, "message");
  const std::string &scope = message.empty() ? response : message;
  const std::string content = common::json_get_string(scope, "content");
  if (content.empty() && !has_empty_string_field(scope, "content")) {
    return common::Result<std::string>::failure("choices[0].message.content missing");
  }
  return common::Result<std::string>::success(content);
}

common::Result<std::string> parse_openai_sse_event_delta(const std::string &event_data) {
  if (common::trim(event_data) == "[DONE]" ||
      event_data.find("\"delta\"") == std::string::npos) {
    return common::Result<std::string>::success("");
  }
  const std::string delta = common::json_get_object(event_data, "delta");
  return common::Result<std::string>::success(common::json_get_string(delta, "content"));
}

common::Result<std::string> parse_openai_sse_content(const std::string &response) {
  const auto events = extract_sse_data_events(response);
  if (events.empty()) {
    return common::Result<std::string>::failure("sse data missing");
  }
  std::string content;
  bool saw_done = false;
  for (const auto &event_data : events) {
    if (common::trim(event_data) == "[DONE]") {
      saw_done = true;
      break;
    }
    auto delta = parse_openai_sse_event_delta(event_data);
    if (!delta.ok()) {
      return delta;
    }
    content += delta.value();
  }
  if (!saw_done && content.empty()) {
    return common::Result<std::string>::failure("no text deltas in SSE stream");
  }
  return common::Result<std::string>::success(content);
}

common::Result<std::string> parse_anthropic_content(const std::string &response) {
  if (response.find("\"content\"") == std::string::npos) {
    return common::Result<std::string>::failure("content field missing");
  }
  std::string text;
  bool found = false;
  for (const auto &block :
       common::json_split_top_level_objects(common::json_get_array(response, "content"))) {
    if (common::json_get_string(block, "type") == "text") {
      text += common::json_get_string(block, "text");
      found = true;
    }
  }
  if (!found) {
    return common::Result<std::string>::failure("content[0].text missing");
  }
  return common::Result<std::string>::success(text);
}

common::Result<std::string> parse_anthropic_sse_event_delta(const std::string &event_data) {
  if (event_data.find("\"content_block_delta\"") == std::string::npos &&
      event_data.find("\"text_delta\"") == std::string::npos) {
    return common::Result<std::string>::success("");
  }
  const std::string delta = common::json_get_object(event_data, "delta");
  return common::Result<std::string>::success(common::json_get_string(delta, "text"));
}

common::Result<std::string> parse_anthropic_sse_content(const std::string &response) {
  const auto events = extract_sse_data_events(response);
  if (events.empty()) {
    return common::Result<std::string>::failure("sse data missing");
  }
  std::string content;
  for (const auto &event_data : events) {
    auto delta = parse_anthropic_sse_event_delta(event_data);
    if (!delta.ok()) {
      return delta;
    }
    content += delta.value();
  }
  if (content.empty()) {
    return common::Result<std::string>::failure("no text deltas in SSE stream");
  }
  return common::Result<std::string>::success(content);
}

void parse_sse_bytes(const std::string_view chunk, std::string &line_buffer,
                     std::string &event_data,
                     const std::function<void(const std::string &)> &on_event_data) {
  line_buffer.append(chunk);
  std::size_t line_end = std::string::npos;
  while ((line_end = line_buffer.find('\n')) != std::string::npos) {
    std::string line = line_buffer.substr(0, line_end);
    line_buffer.erase(0, line_end + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      if (!event_data.empty()) {
        on_event_data(event_data);
        event_data.clear();
      }
      continue;
    }
    if (!common::starts_with(line, "data:")) {
      continue;
    }
    std::string payload = line.substr(5);
    if (!payload.empty() && payload.front() == ' ') {
      payload.erase(payload.begin());
    }
    if (!event_data.empty()) {
      event_data.push_back('\n');
    }
    event_data += payload;
  }
}

common::Status validate_http_response(const HttpResponse &response) {
  if (response.timeout) {
    return common::Status::error(
        ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"}
            .to_string());
  }
  if (response.network_error) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::NetworkError,
                                               .message = response.network_error_message}
                                     .to_string());
  }
  if (response.status == 401 || response.status == 403) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::AuthError,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }
  if (response.status == 404) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::ModelNotFound,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }
  if (response.status == 429) {
    ProviderError error{.code = ProviderErrorCode::RateLimitError,
                        .status = response.status,
                        .message = response.body};
    if (const auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      char *end = nullptr;
      const auto seconds = std::strtoull(it->second.c_str(), &end, 10);
      if (end != it->second.c_str()) {
        error.retry_after = seconds;
      }
    }
    return common::Status::error(error.to_string());
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::ApiError,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }
  return common::Status::success();
}

bool is_sse_response(const HttpResponse &response) {
  const auto it = response.headers.find("content-type");
  if (it != response.headers.end() &&
      common::to_lower(it->second).find("text/event-stream") != std::string::npos) {
    return true;
  }
  return common::starts_with(common::trim(response.body), "data:");
}

} // namespace cowork::providers

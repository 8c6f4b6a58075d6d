#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cowork/config/schema.hpp"
#include "cowork/providers/anthropic.hpp"
#include "cowork/providers/compatible.hpp"
#include "cowork/providers/factory.hpp"
#include "cowork/providers/reliable.hpp"
#include "cowork/providers/traits.hpp"

#include <cstdlib>
#include <memory>

namespace {

namespace pv = cowork::providers;

class MockHttpClient final : public pv::HttpClient {
public:
  pv::HttpResponse next_post;
  pv::HttpResponse next_post_stream;
  std::vector<std::string> stream_chunks;
  std::string last_url;
  std::unordered_map<std::string, std::string> last_headers;
  std::string last_body;
  int posts = 0;

  [[nodiscard]] pv::HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t) override {
    ++posts;
    last_url = url;
    last_headers = headers;
    last_body = body;
    return next_post;
  }

  [[nodiscard]] pv::HttpResponse
  post_json_stream(const std::string &url,
                   const std::unordered_map<std::string, std::string> &headers,
                   const std::string &body, std::uint64_t,
                   const pv::StreamChunkCallback &on_chunk) override {
    ++posts;
    last_url = url;
    last_headers = headers;
    last_body = body;
    for (const auto &chunk : stream_chunks) {
      if (on_chunk) {
        on_chunk(chunk);
      }
    }
    return next_post_stream;
  }
};

pv::HttpResponse ok_json(std::string body) {
  return pv::HttpResponse{.status = 200, .body = std::move(body)};
}

pv::ChatRequest sample_request() {
  pv::ChatRequest request;
  request.preamble = "Be brief.";
  request.model = "gpt-4o-mini";
  request.temperature = 0.2;
  request.history = {pv::ChatMessage::user("hi"), pv::ChatMessage::assistant("hello"),
                     pv::ChatMessage::tool("Tool result: ok")};
  return request;
}

class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    if (const char *old = std::getenv(name)) {
      old_ = old;
    }
    if (value != nullptr) {
      setenv(name, value, 1);
    } else {
      unsetenv(name);
    }
  }
  ~ScopedEnv() {
    if (old_.has_value()) {
      setenv(name_.c_str(), old_->c_str(), 1);
    } else {
      unsetenv(name_.c_str());
    }
  }

private:
  std::string name_;
  std::optional<std::string> old_;
};

} // namespace

void register_provider_tests(std::vector<cowork::tests::TestCase> &tests) {
  using cowork::tests::require;

  tests.push_back({"provider_compatible_success_parse", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->next_post = ok_json(
                         R"({"choices":[{"message":{"role":"assistant","content":"Hi there"}}]})");
                     pv::CompatibleProvider provider("openai", "https://api.example.com/v1/", "k",
                                                     http);
                     auto result = provider.chat(sample_request());
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(result.value() == "Hi there", "content");
                     require(http->last_url == "https://api.example.com/v1/chat/completions",
                             http->last_url);
                     require(http->last_headers.at("Authorization") == "Bearer k", "bearer header");
                   }});

  tests.push_back({"provider_compatible_request_body", [] {
                     pv::CompatibleProvider provider("openai", "https://x", "k",
                                                     std::make_shared<MockHttpClient>());
                     const auto body = provider.build_body(sample_request(), false);
                     require(body.find(R"({"role":"system","content":"Be brief."})") !=
                                 std::string::npos,
                             "system turn");
                     require(body.find(R"({"role":"user","content":"Tool result: ok"})") !=
                                 std::string::npos,
                             "tool turns sent as user");
                     require(body.find("\"stream\":false") != std::string::npos, "stream flag");
                     require(body.find("\"model\":\"gpt-4o-mini\"") != std::string::npos, "model");
                   }});

  tests.push_back({"provider_compatible_missing_key", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     pv::CompatibleProvider provider("openai", "https://x", "", http);
                     auto result = provider.chat(sample_request());
                     require(!result.ok(), "missing key fails");
                     require(result.error().find("[auth]") != std::string::npos, result.error());
                     require(http->posts == 0, "no request sent");

                     pv::CompatibleProvider local("ollama", "http://localhost:11434/v1", "", http,
                                                  false);
                     http->next_post = ok_json(R"({"choices":[{"message":{"content":""}}]})");
                     auto empty = local.chat(sample_request());
                     require(empty.ok() && empty.value().empty(), "empty content is valid");
                     require(http->last_headers.count("Authorization") == 0, "no auth header");
                   }});

  tests.push_back({"provider_compatible_invalid_response", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->next_post = ok_json(R"({"error":"nope"})");
                     pv::CompatibleProvider provider("openai", "https://x", "k", http);
                     auto result = provider.chat(sample_request());
                     require(!result.ok(), "malformed payload fails");
                     require(result.error().find("[invalid_response]") != std::string::npos,
                             result.error());
                   }});

  tests.push_back({"provider_compatible_streaming_aggregates_chunks", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->stream_chunks = {
                         "data: {\"choices\":[{\"delta\":{\"content\":\"Hel\"}}]}\n\n",
                         "data: {\"choices\":[{\"delta\":{\"content\":\"lo\"}}]}\n",
                         "\ndata: [DONE]\n\n"};
                     http->next_post_stream =
                         pv::HttpResponse{.status = 200,
                                          .headers = {{"content-type", "text/event-stream"}}};
                     pv::CompatibleProvider provider("openai", "https://x", "k", http);
                     std::vector<std::string> chunks;
                     auto result = provider.stream(sample_request(), [&](std::string_view chunk) {
                       chunks.emplace_back(chunk);
                     });
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(result.value() == "Hello", result.value());
                     require(chunks.size() == 2 && chunks[0] == "Hel", "deltas forwarded");
                     require(http->last_headers.at("Accept") == "text/event-stream", "sse accept");
                   }});

  tests.push_back({"provider_anthropic_headers_and_merged_turns", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->next_post = ok_json(
                         R"({"content":[{"type":"text","text":"A"},{"type":"text","text":"B"}]})");
                     pv::AnthropicProvider provider("secret", http, "https://anthropic.test/");
                     auto request = sample_request();
                     auto result = provider.chat(request);
                     require(result.ok() && result.value() == "AB", "text blocks joined");
                     require(http->last_url == "https://anthropic.test/v1/messages", http->last_url);
                     require(http->last_headers.at("x-api-key") == "secret", "api key header");
                     require(http->last_headers.at("anthropic-version") == "2023-06-01", "version");
                     const auto body = provider.build_body(request, false);
                     require(body.find("\"system\":\"Be brief.\"") != std::string::npos, "system");
                     require(body.find("\"max_tokens\":4096") != std::string::npos, "max tokens");
                     require(body.find(R"({"role":"user","content":"hi"})") != std::string::npos,
                             "first user turn");
                     require(body.find("Tool result: ok") != std::string::npos, "tool turn kept");
                     require(body.find("\"stream\"") == std::string::npos, "no stream flag");
                   }});

  tests.push_back({"provider_anthropic_full_message_body", [] {
                     auto parsed = pv::parse_anthropic_content(
                         R"({"id":"msg_1","type":"message","role":"assistant",)"
                         R"("content":[{"type":"text","text":"Hello there"}],)"
                         R"("stop_reason":"end_turn"})");
                     require(parsed.ok() && parsed.value() == "Hello there",
                             "text read from message body: " + parsed.value_or("<error>"));
                   }});

  tests.push_back({"provider_anthropic_sse_parse", [] {
                     const std::string sse =
                         "event: content_block_delta\n"
                         "data: {\"type\":\"content_block_delta\",\"delta\":{\"type\":\"text_delta\","
                         "\"text\":\"Hi\"}}\n\n"
                         "data: {\"type\":\"message_stop\"}\n\n";
                     auto parsed = pv::parse_anthropic_sse_content(sse);
                     require(parsed.ok() && parsed.value() == "Hi", "anthropic sse");
                     require(!pv::parse_anthropic_sse_content("data: {\"type\":\"ping\"}\n\n").ok(),
                             "no deltas is an error");
                   }});

  tests.push_back({"provider_openai_sse_parse", [] {
                     const std::string sse = "data: {\"choices\":[{\"delta\":{\"content\":\"a\"}}]}\n"
                                             "\n"
                                             "data: {\"choices\":[{\"delta\":{\"content\":\"b\"}}]}\n"
                                             "\n"
                                             "data: [DONE]\n\n";
                     auto parsed = pv::parse_openai_sse_content(sse);
                     require(parsed.ok() && parsed.value() == "ab", "openai sse");
                     require(!pv::parse_openai_sse_content("nothing").ok(), "no data lines");
                   }});

  tests.push_back({"provider_sse_bytes_split_across_chunks", [] {
                     std::string line_buffer;
                     std::string event_data;
                     std::vector<std::string> events;
                     const auto collect = [&](const std::string &event) { events.push_back(event); };
                     pv::parse_sse_bytes("data: par", line_buffer, event_data, collect);
                     require(events.empty(), "incomplete line held back");
                     pv::parse_sse_bytes("t1\r\ndata: part2\n\n", line_buffer, event_data, collect);
                     require(events.size() == 1 && events[0] == "part1\npart2",
                             "multi-line data joined");
                   }});

  tests.push_back({"provider_validate_http_response_codes", [] {
                     pv::HttpResponse response;
                     response.status = 401;
                     require(pv::validate_http_response(response).error().find("[auth]") !=
                                 std::string::npos,
                             "401 auth");
                     response.status = 404;
                     require(pv::validate_http_response(response).error().find("[model_not_found]") !=
                                 std::string::npos,
                             "404 model");
                     response.status = 429;
                     response.headers["retry-after"] = "7";
                     require(pv::validate_http_response(response).error().find("retry_after=7") !=
                                 std::string::npos,
                             "retry after");
                     response.status = 500;
                     require(pv::validate_http_response(response).error().find("status=500") !=
                                 std::string::npos,
                             "server error");
                     pv::HttpResponse timed_out;
                     timed_out.timeout = true;
                     timed_out.network_error = true;
                     require(pv::validate_http_response(timed_out).error().find("[timeout]") !=
                                 std::string::npos,
                             "timeout wins");
                     require(pv::validate_http_response(ok_json("{}")).ok(), "200 ok");
                   }});

  tests.push_back({"provider_reliable_retries_then_falls_back", [] {
                     auto primary = std::make_shared<cowork::testing::ScriptedProvider>();
                     primary->push_error("boom 1");
                     primary->push_error("boom 2");
                     primary->push_error("boom 3");
                     auto fallback = std::make_shared<cowork::testing::ScriptedProvider>(
                         std::vector<std::string>{"rescued"});
                     std::vector<std::chrono::milliseconds> sleeps;
                     pv::ReliableProvider reliable(
                         primary, {fallback}, 2, 100,
                         [&](std::chrono::milliseconds delay) { sleeps.push_back(delay); });
                     auto result = reliable.chat(sample_request());
                     require(result.ok() && result.value() == "rescued", "fallback answer");
                     require(primary->requests().size() == 3, "one try plus two retries");
                     require(sleeps.size() == 2 && sleeps[0].count() == 100 && sleeps[1].count() == 200,
                             "exponential backoff");
                     require(reliable.name() == "scripted", "named after primary");
                   }});

  tests.push_back({"provider_reliable_reports_last_error", [] {
                     auto primary = std::make_shared<cowork::testing::ScriptedProvider>();
                     primary->push_error("first");
                     auto fallback = std::make_shared<cowork::testing::ScriptedProvider>();
                     fallback->push_error("second");
                     pv::ReliableProvider reliable(primary, {fallback}, 0, 10,
                                                   [](std::chrono::milliseconds) {});
                     auto result = reliable.chat(sample_request());
                     require(!result.ok() && result.error() == "second", "last error kept");
                   }});

  tests.push_back({"provider_factory_selection", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     cowork::config::Config config;
                     config.agent.provider = "anthropic";
                     config.agent.api_key = "key";
                     auto anthropic = pv::create_provider(config, http);
                     require(anthropic.ok() && anthropic.value()->name() == "anthropic", "anthropic");

                     config.agent.provider = "Ollama";
                     config.agent.api_key.reset();
                     auto ollama = pv::create_provider(config, http);
                     require(ollama.ok() && ollama.value()->name() == "ollama", "keyless ollama");

                     config.agent.provider = "cohere";
                     auto unsupported = pv::create_provider(config, http);
                     require(!unsupported.ok() &&
                                 unsupported.error() == "Unsupported provider: cohere",
                             "unsupported provider");
                   }});

  tests.push_back({"provider_factory_missing_key", [] {
                     ScopedEnv guard("GEMINI_API_KEY", nullptr);
                     cowork::config::Config config;
                     config.agent.provider = "gemini";
                     auto missing = pv::create_provider(config, std::make_shared<MockHttpClient>());
                     require(!missing.ok(), "no key anywhere");
                     require(missing.error() == "Error: GEMINI_API_KEY not set (env or settings)",
                             missing.error());
                     ScopedEnv with_key("GEMINI_API_KEY", " from-env ");
                     auto key = pv::resolve_api_key("gemini", std::nullopt);
                     require(key.ok() && key.value() == "from-env", "env key trimmed");
                   }});

  tests.push_back({"provider_factory_wraps_fallbacks", [] {
                     ScopedEnv guard("OPENAI_API_KEY", "env-key");
                     cowork::config::Config config;
                     config.agent.provider = "anthropic";
                     config.agent.api_key = "key";
                     config.providers.fallbacks = {"openai"};
                     auto created = pv::create_provider(config, std::make_shared<MockHttpClient>());
                     require(created.ok(), created.ok() ? "" : created.error());
                     require(dynamic_cast<pv::ReliableProvider *>(created.value().get()) != nullptr,
                             "wrapped in retry layer");
                     config.providers.fallbacks = {"nope"};
                     auto bad = pv::create_provider(config, std::make_shared<MockHttpClient>());
                     require(!bad.ok() && bad.error().find("Invalid fallback provider 'nope'") == 0,
                             "bad fallback");
                   }});

  tests.push_back({"provider_fast_model_per_provider", [] {
                     require(pv::fast_model("Anthropic") == "claude-3-haiku-20240307", "anthropic");
                     require(pv::fast_model("gemini") == "gemini-2.0-flash", "gemini");
                     require(pv::fast_model("openai") == "gpt-4o-mini", "default");
                   }});
}

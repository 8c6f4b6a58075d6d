#include "cowork/providers/factory.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/providers/anthropic.hpp"
#include "cowork/providers/compatible.hpp"
#include "cowork/providers/reliable.hpp"

#include <cstdlib>
#include <vector>

namespace cowork::providers {

namespace {

constexpr const char *kOpenAiBaseUrl = "https://api.openai.com/v1";
constexpr const char *kGeminiBaseUrl = "https://generativelanguage.googleapis.com/v1beta/openai";
constexpr const char *kOpenRouterBaseUrl = "https://openrouter.ai/api/v1";
constexpr const char *kOllamaBaseUrl = "http://localhost:11434/v1";
constexpr const char *kAnthropicBaseUrl = "https://api.anthropic.com";

std::optional<std::string> read_env(const std::string &name) {
  if (name.empty()) {
    return std::nullopt;
  }
  const char *value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  const std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::string pick(const std::string &configured, const char *fallback) {
  return common::trim(configured).empty() ? std::string(fallback) : configured;
}

common::Result<std::shared_ptr<Provider>>
create_single(const std::string &raw_name, const std::optional<std::string> &configured_key,
              const config::ProviderEndpoints &endpoints,
              const std::shared_ptr<HttpClient> &http_client) {
  using ResultT = common::Result<std::shared_ptr<Provider>>;
  const std::string name = common::to_lower(common::trim(raw_name));

  if (name == "ollama") {
    return ResultT::success(std::make_shared<CompatibleProvider>(
        "ollama", pick(endpoints.ollama_base_url, kOllamaBaseUrl), configured_key.value_or(""),
        http_client, false));
  }
  if (name != "openai" && name != "gemini" && name != "openrouter" && name != "anthropic") {
    return ResultT::failure("Unsupported provider: " + raw_name);
  }

  auto key = resolve_api_key(name, configured_key);
  if (!key.ok()) {
    return ResultT::failure(key.error());
  }
  if (name == "anthropic") {
    return ResultT::success(std::make_shared<AnthropicProvider>(
        key.value(), http_client, pick(endpoints.anthropic_base_url, kAnthropicBaseUrl)));
  }
  if (name == "gemini") {
    return ResultT::success(std::make_shared<CompatibleProvider>(
        "gemini", pick(endpoints.gemini_base_url, kGeminiBaseUrl), key.value(), http_client));
  }
  if (name == "openrouter") {
    return ResultT::success(std::make_shared<CompatibleProvider>(
        "openrouter", kOpenRouterBaseUrl, key.value(), http_client, true,
        std::unordered_map<std::string, std::string>{{"X-Title", "cowork"}}));
  }
  return ResultT::success(std::make_shared<CompatibleProvider>(
      "openai", pick(endpoints.openai_base_url, kOpenAiBaseUrl), key.value(), http_client));
}

} // namespace

std::string api_key_env_var(const std::string &provider) {
  const std::string name = common::to_lower(common::trim(provider));
  if (name == "openai") {
    return "OPENAI_API_KEY";
  }
  if (name == "gemini") {
    return "GEMINI_API_KEY";
  }
  if (name == "anthropic") {
    return "ANTHROPIC_API_KEY";
  }
  if (name == "openrouter") {
    return "OPENROUTER_API_KEY";
  }
  return "";
}

common::Result<std::string> resolve_api_key(const std::string &provider,
                                            const std::optional<std::string> &configured) {
  if (configured.has_value() && !common::trim(*configured).empty()) {
    return common::Result<std::string>::success(common::trim(*configured));
  }
  const std::string var = api_key_env_var(provider);
  if (var.empty()) {
    return common::Result<std::string>::success("");
  }
  if (auto value = read_env(var); value.has_value()) {
    return common::Result<std::string>::success(*value);
  }
  return common::Result<std::string>::failure("Error: " + var + " not set (env or settings)");
}

common::Result<std::shared_ptr<Provider>> create_provider(const config::Config &config,
                                                          std::shared_ptr<HttpClient> http_client) {
  using ResultT = common::Result<std::shared_ptr<Provider>>;
  auto primary =
      create_single(config.agent.provider, config.agent.api_key, config.providers, http_client);
  if (!primary.ok()) {
    return primary;
  }
  const auto &endpoints = config.providers;
  if (endpoints.max_retries == 0 && endpoints.fallbacks.empty()) {
    return primary;
  }

  std::vector<std::shared_ptr<Provider>> fallbacks;
  for (const auto &name : endpoints.fallbacks) {
    // The configured key belongs to the primary provider; fallbacks read their own variable.
    auto fallback = create_single(name, std::nullopt, endpoints, http_client);
    if (!fallback.ok()) {
      return ResultT::failure("Invalid fallback provider '" + name + "': " + fallback.error());
    }
    fallbacks.push_back(std::move(fallback.value()));
  }
  return ResultT::success(std::make_shared<ReliableProvider>(
      std::move(primary.value()), std::move(fallbacks), endpoints.max_retries,
      endpoints.retry_backoff_ms));
}

} // namespace cowork::providers

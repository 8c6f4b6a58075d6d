#pragma once

#include "cowork/providers/traits.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace cowork::providers {

class AnthropicProvider final : public Provider {
public:
  static constexpr std::uint32_t kMaxTokens = 4096;

  explicit AnthropicProvider(std::string api_key,
                             std::shared_ptr<HttpClient> http_client =
                                 std::make_shared<CurlHttpClient>(),
                             std::string base_url = "https://api.anthropic.com");

  [[nodiscard]] common::Result<std::string> chat(const ChatRequest &request) override;
  [[nodiscard]] common::Result<std::string> stream(const ChatRequest &request,
                                                   const StreamChunkCallback &on_chunk) override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] std::string build_body(const ChatRequest &request, bool stream) const;

private:
  [[nodiscard]] std::unordered_map<std::string, std::string> build_headers(bool stream) const;
  [[nodiscard]] std::string messages_url() const;

  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  std::string base_url_;
};

} // namespace cowork::providers

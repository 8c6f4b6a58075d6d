#pragma once

#include "cowork/providers/traits.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace cowork::providers {

/// Any endpoint speaking the OpenAI chat-completions wire format.
class CompatibleProvider : public Provider {
public:
  CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                     std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>(),
                     bool require_api_key = true,
                     std::unordered_map<std::string, std::string> extra_headers = {});

  [[nodiscard]] common::Result<std::string> chat(const ChatRequest &request) override;
  [[nodiscard]] common::Result<std::string> stream(const ChatRequest &request,
                                                   const StreamChunkCallback &on_chunk) override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] std::string build_body(const ChatRequest &request, bool stream) const;

private:
  [[nodiscard]] std::unordered_map<std::string, std::string> build_headers(bool stream) const;
  [[nodiscard]] std::string completions_url() const;
  [[nodiscard]] common::Status check_key() const;

  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  bool require_api_key_ = true;
  std::unordered_map<std::string, std::string> extra_headers_;
};

} // namespace cowork::providers

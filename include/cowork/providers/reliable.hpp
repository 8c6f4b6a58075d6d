#pragma once

#include "cowork/providers/traits.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace cowork::providers {

using SleepFn = std::function<void(std::chrono::milliseconds)>;

/// Retries the primary with exponential backoff, then walks the fallbacks in order.
class ReliableProvider final : public Provider {
public:
  ReliableProvider(std::shared_ptr<Provider> primary, std::vector<std::shared_ptr<Provider>> fallbacks,
                   std::uint32_t max_retries, std::uint64_t backoff_ms, SleepFn sleep = {});

  [[nodiscard]] common::Result<std::string> chat(const ChatRequest &request) override;
  [[nodiscard]] common::Result<std::string> stream(const ChatRequest &request,
                                                   const StreamChunkCallback &on_chunk) override;
  [[nodiscard]] std::string name() const override;

private:
  using Call = std::function<common::Result<std::string>(Provider &)>;

  [[nodiscard]] common::Result<std::string> run(const Call &call) const;
  [[nodiscard]] common::Result<std::string> execute_with_provider(Provider &provider,
                                                                  const Call &call) const;

  std::shared_ptr<Provider> primary_;
  std::vector<std::shared_ptr<Provider>> fallbacks_;
  std::uint32_t max_retries_;
  std::uint64_t backoff_ms_;
  SleepFn sleep_;
};

} // namespace cowork::providers

#include "cowork/providers/reliable.hpp"

#include "cowork/observability/log.hpp"

#include <thread>

namespace cowork::providers {

ReliableProvider::ReliableProvider(std::shared_ptr<Provider> primary,
                                   std::vector<std::shared_ptr<Provider>> fallbacks,
                                   const std::uint32_t max_retries, const std::uint64_t backoff_ms,
                                   SleepFn sleep)
    : primary_(std::move(primary)), fallbacks_(std::move(fallbacks)), max_retries_(max_retries),
      backoff_ms_(backoff_ms), sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

common::Result<std::string> ReliableProvider::execute_with_provider(Provider &provider,
                                                                    const Call &call) const {
  std::string last_error;
  for (std::uint32_t attempt = 0; attempt <= max_retries_; ++attempt) {
    auto result = call(provider);
    if (result.ok()) {
      return result;
    }
    last_error = result.error();
    if (attempt < max_retries_) {
      const std::uint64_t delay = backoff_ms_ * (1ULL << attempt);
      observability::log_warn(provider.name() + " request failed, retrying in " +
                              std::to_string(delay) + "ms: " + last_error);
      sleep_(std::chrono::milliseconds(delay));
    }
  }
  return common::Result<std::string>::failure(last_error);
}

common::Result<std::string> ReliableProvider::run(const Call &call) const {
  auto result = execute_with_provider(*primary_, call);
  if (result.ok()) {
    return result;
  }
  std::string last_error = result.error();
  for (const auto &fallback : fallbacks_) {
    observability::log_warn("falling back to provider " + fallback->name());
    result = execute_with_provider(*fallback, call);
    if (result.ok()) {
      return result;
    }
    last_error = result.error();
  }
  return common::Result<std::string>::failure(last_error);
}

common::Result<std::string> ReliableProvider::chat(const ChatRequest &request) {
  return run([&request](Provider &provider) { return provider.chat(request); });
}

common::Result<std::string> ReliableProvider::stream(const ChatRequest &request,
                                                     const StreamChunkCallback &on_chunk) {
  return run([&](Provider &provider) { return provider.stream(request, on_chunk); });
}

std::string ReliableProvider::name() const { return primary_->name(); }

} // namespace cowork::providers

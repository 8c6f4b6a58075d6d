#pragma once

#include "cowork/common/result.hpp"
#include "cowork/config/schema.hpp"
#include "cowork/providers/traits.hpp"

#include <memory>
#include <optional>
#include <string>

namespace cowork::providers {

/// Environment variable holding the key for `provider`, empty when none is needed.
[[nodiscard]] std::string api_key_env_var(const std::string &provider);

/// Key from the settings when present, else from the environment.
[[nodiscard]] common::Result<std::string> resolve_api_key(const std::string &provider,
                                                          const std::optional<std::string> &configured);

[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_provider(const config::Config &config,
                std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

} // namespace cowork::providers

#pragma once

#include "cowork/providers/traits.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cowork::agent {

enum class QueryType { Simple, Complex };

[[nodiscard]] std::string_view to_string(QueryType type);

/// Keyword pass only. Complex markers are checked before simple ones; nothing when no
/// marker matches.
[[nodiscard]] std::optional<QueryType> classify_by_markers(const std::string &query);

/// Decides whether a request needs tools and planning or just a direct answer.
class Router {
public:
  Router(std::shared_ptr<providers::Provider> provider, std::string fast_model,
         bool use_llm_fallback = true);

  /// Never fails: an unanswerable or failed model call reads as Complex.
  [[nodiscard]] QueryType classify(const std::string &query) const;

private:
  [[nodiscard]] QueryType classify_with_llm(const std::string &query) const;

  std::shared_ptr<providers::Provider> provider_;
  std::string fast_model_;
  bool use_llm_fallback_;
};

} // namespace cowork::agent

#include "cowork/agent/router.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/observability/log.hpp"

#include <array>

namespace cowork::agent {

namespace {

constexpr std::array<const char *, 34> kComplexMarkers = {
    "create",     "write",       "make",   "build",   "generate", "implement", "edit",
    "modify",     "change",      "update", "fix",     "refactor", "delete",    "remove",
    "run",        "execute",     "install", "file",   "folder",   "directory", "code",
    "script",     "search for",  "find",   "list files", "read file", "commit", "push",
    "pull",       "deploy",      "test",   "debug",   "compile",  "lint"};

constexpr std::array<const char *, 24> kSimpleMarkers = {
    "hello",         "hi",         "hey",      "good morning", "good afternoon",
    "good evening",  "how are you", "what's up", "thanks",     "thank you",
    "bye",           "goodbye",    "what is",  "what are",     "who is",
    "who are",       "why is",     "why are",  "explain",      "tell me about",
    "describe",      "define",     "can you help", "help me understand"};

constexpr const char *kClassifierPrompt =
    R"(You are a query classifier. Classify the user's query into one of two categories:

SIMPLE - Queries that can be answered with just conversation/knowledge:
- Greetings and small talk
- General knowledge questions
- Explanations and definitions
- Opinions and advice
- Simple Q&A

COMPLEX - Queries that require tools, file operations, or multi-step execution:
- Creating, editing, or deleting files
- Running commands or scripts
- Searching codebases
- Building or deploying software
- Any task requiring system access

Respond with ONLY one word: "SIMPLE" or "COMPLEX")";

} // namespace

std::string_view to_string(const QueryType type) {
  return type == QueryType::Simple ? "simple" : "complex";
}

std::optional<QueryType> classify_by_markers(const std::string &query) {
  const std::string lower = common::to_lower(query);
  for (const char *marker : kComplexMarkers) {
    if (lower.find(marker) != std::string::npos) {
      observability::log_debug(std::string("router: complex marker '") + marker + "'");
      return QueryType::Complex;
    }
  }
  for (const char *marker : kSimpleMarkers) {
    if (lower.find(marker) != std::string::npos) {
      observability::log_debug(std::string("router: simple marker '") + marker + "'");
      return QueryType::Simple;
    }
  }
  return std::nullopt;
}

Router::Router(std::shared_ptr<providers::Provider> provider, std::string fast_model,
               const bool use_llm_fallback)
    : provider_(std::move(provider)), fast_model_(std::move(fast_model)),
      use_llm_fallback_(use_llm_fallback) {}

QueryType Router::classify(const std::string &query) const {
  if (auto by_marker = classify_by_markers(query); by_marker.has_value()) {
    return *by_marker;
  }
  if (!use_llm_fallback_ || !provider_) {
    return QueryType::Complex;
  }
  return classify_with_llm(query);
}

QueryType Router::classify_with_llm(const std::string &query) const {
  providers::ChatRequest request;
  request.preamble = kClassifierPrompt;
  request.history.push_back(providers::ChatMessage::user(query));
  request.model = fast_model_;
  request.temperature = 0.0;

  auto reply = provider_->chat(request);
  if (!reply.ok()) {
    observability::log_info("router: classification failed, defaulting to complex: " +
                            reply.error());
    return QueryType::Complex;
  }
  if (common::to_upper(common::trim(reply.value())).find("SIMPLE") != std::string::npos) {
    observability::log_info("router: model classified query as simple");
    return QueryType::Simple;
  }
  observability::log_info("router: model classified query as complex");
  return QueryType::Complex;
}

} // namespace cowork::agent

#pragma once

#include "cowork/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cowork::config {

/// Agent-level policy for privileged and skill work.
enum class ExecutionMode { Sandbox, Direct, Flexible };

[[nodiscard]] std::string_view to_string(ExecutionMode mode);
[[nodiscard]] common::Result<ExecutionMode> execution_mode_from_string(const std::string &value);

enum class ScopeType { Global, Workspace };

[[nodiscard]] std::string_view to_string(ScopeType scope);
/// Anything other than "workspace" reads as Global.
[[nodiscard]] ScopeType scope_type_from_string(const std::string &value);

struct AgentConfig {
  std::string provider = "openai";
  std::string model = "gpt-4o";
  double temperature = 0.7;
  std::uint32_t max_turns = 10;
  std::string system_prompt;
  std::string workspace;
  ExecutionMode execution_mode = ExecutionMode::Flexible;
  ScopeType scope = ScopeType::Global;
  std::optional<std::string> api_key;
};

struct PlannerConfig {
  std::uint32_t max_attempts = 3;
  std::uint64_t base_backoff_ms = 1000;
  std::size_t excerpt_chars = 200;
};

struct RouterConfig {
  bool use_llm_fallback = true;
  std::string fast_model;
};

struct HistoryConfig {
  std::size_t max_result_chars = 8000;
  std::size_t max_history_chars = 64000;
};

struct SandboxSettings {
  std::string image;
  std::string memory_limit = "256m";
  double cpu_limit = 0.5;
  std::uint64_t timeout_seconds = 300;
  bool network_enabled = false;
  std::string docker_binary = "docker";
};

struct PermissionsConfig {
  bool autonomous = false;
  bool cache_allow_always = true;
};

struct StoreConfig {
  std::string path;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct ProviderEndpoints {
  std::string openai_base_url;
  std::string anthropic_base_url;
  std::string gemini_base_url;
  std::string ollama_base_url;
  /// Extra attempts against each provider before moving to the next one.
  std::uint32_t max_retries = 0;
  std::uint64_t retry_backoff_ms = 500;
  std::vector<std::string> fallbacks;
};

struct Config {
  AgentConfig agent;
  PlannerConfig planner;
  RouterConfig router;
  HistoryConfig history;
  SandboxSettings sandbox;
  PermissionsConfig permissions;
  StoreConfig store;
  ObservabilityConfig observability;
  ProviderEndpoints providers;
};

} // namespace cowork::config

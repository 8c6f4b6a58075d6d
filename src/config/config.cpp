#include "cowork/config/config.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cowork::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".cowork";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *STORE_FILENAME = "cowork.db";

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("COWORK_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

std::string strip_env_quotes(std::string value) {
  value = common::trim(value);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

// KEY=VALUE lines; existing environment variables win.
void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty() || env_value(key.c_str()) != nullptr) {
      continue;
    }
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  if (const char *env_file = env_value("COWORK_ENV_FILE"); env_file != nullptr) {
    load_dotenv_file(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
}

const char *bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

std::string_view to_string(ExecutionMode mode) {
  switch (mode) {
  case ExecutionMode::Sandbox:
    return "sandbox";
  case ExecutionMode::Direct:
    return "direct";
  case ExecutionMode::Flexible:
    return "flexible";
  }
  return "flexible";
}

common::Result<ExecutionMode> execution_mode_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "sandbox") {
    return common::Result<ExecutionMode>::success(ExecutionMode::Sandbox);
  }
  if (normalized == "direct") {
    return common::Result<ExecutionMode>::success(ExecutionMode::Direct);
  }
  if (normalized == "flexible") {
    return common::Result<ExecutionMode>::success(ExecutionMode::Flexible);
  }
  return common::Result<ExecutionMode>::failure("Unknown execution mode: " + value);
}

std::string_view to_string(ScopeType scope) {
  return scope == ScopeType::Workspace ? "workspace" : "global";
}

ScopeType scope_type_from_string(const std::string &value) {
  return common::to_lower(common::trim(value)) == "workspace" ? ScopeType::Workspace
                                                             : ScopeType::Global;
}

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->extension().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->extension().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *provider = env_value("COWORK_PROVIDER"); provider != nullptr) {
    config.agent.provider = provider;
  }
  if (const char *model = env_value("COWORK_MODEL"); model != nullptr) {
    config.agent.model = model;
  }
  if (const char *api_key = env_value("COWORK_API_KEY"); api_key != nullptr) {
    config.agent.api_key = std::string(api_key);
  }
  if (const char *workspace = env_value("COWORK_WORKSPACE"); workspace != nullptr) {
    config.agent.workspace = workspace;
  }
  if (const char *mode = env_value("COWORK_EXECUTION_MODE"); mode != nullptr) {
    if (auto parsed = execution_mode_from_string(mode); parsed.ok()) {
      config.agent.execution_mode = parsed.value();
    }
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();
  Config config;

  auto &agent = config.agent;
  agent.provider = doc.get_string("agent.provider", agent.provider);
  agent.model = doc.get_string("agent.model", agent.model);
  agent.temperature = doc.get_double("agent.temperature", agent.temperature);
  agent.max_turns = static_cast<std::uint32_t>(
      doc.get_u64("agent.max_turns", static_cast<std::uint64_t>(agent.max_turns)));
  agent.system_prompt = doc.get_string("agent.system_prompt");
  agent.workspace = doc.get_string("agent.workspace");
  if (doc.has("agent.api_key")) {
    agent.api_key = doc.get_string("agent.api_key");
  }
  if (doc.has("agent.execution_mode")) {
    auto mode = execution_mode_from_string(doc.get_string("agent.execution_mode"));
    if (!mode.ok()) {
      return common::Result<Config>::failure(mode.error());
    }
    agent.execution_mode = mode.value();
  }
  agent.scope = scope_type_from_string(doc.get_string("agent.scope", "global"));

  config.planner.max_attempts = static_cast<std::uint32_t>(
      doc.get_u64("planner.max_attempts", config.planner.max_attempts));
  config.planner.base_backoff_ms =
      doc.get_u64("planner.base_backoff_ms", config.planner.base_backoff_ms);
  config.planner.excerpt_chars = static_cast<std::size_t>(
      doc.get_u64("planner.excerpt_chars", config.planner.excerpt_chars));

  config.router.use_llm_fallback =
      doc.get_bool("router.use_llm_fallback", config.router.use_llm_fallback);
  config.router.fast_model = doc.get_string("router.fast_model");

  config.history.max_result_chars = static_cast<std::size_t>(
      doc.get_u64("history.max_result_chars", config.history.max_result_chars));
  config.history.max_history_chars = static_cast<std::size_t>(
      doc.get_u64("history.max_history_chars", config.history.max_history_chars));

  auto &sandbox = config.sandbox;
  sandbox.image = doc.get_string("sandbox.image");
  sandbox.memory_limit = doc.get_string("sandbox.memory_limit", sandbox.memory_limit);
  sandbox.cpu_limit = doc.get_double("sandbox.cpu_limit", sandbox.cpu_limit);
  sandbox.timeout_seconds = doc.get_u64("sandbox.timeout_seconds", sandbox.timeout_seconds);
  sandbox.network_enabled = doc.get_bool("sandbox.network_enabled", sandbox.network_enabled);
  sandbox.docker_binary = doc.get_string("sandbox.docker_binary", sandbox.docker_binary);

  config.permissions.autonomous =
      doc.get_bool("permissions.autonomous", config.permissions.autonomous);
  config.permissions.cache_allow_always =
      doc.get_bool("permissions.cache_allow_always", config.permissions.cache_allow_always);

  config.store.path = doc.get_string("store.path");
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level = doc.get_string("observability.level", config.observability.level);

  config.providers.openai_base_url = doc.get_string("providers.openai_base_url");
  config.providers.anthropic_base_url = doc.get_string("providers.anthropic_base_url");
  config.providers.gemini_base_url = doc.get_string("providers.gemini_base_url");
  config.providers.ollama_base_url = doc.get_string("providers.ollama_base_url");
  config.providers.max_retries = static_cast<std::uint32_t>(
      doc.get_u64("providers.max_retries", config.providers.max_retries));
  config.providers.retry_backoff_ms =
      doc.get_u64("providers.retry_backoff_ms", config.providers.retry_backoff_ms);
  config.providers.fallbacks = doc.get_string_array("providers.fallbacks");

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }

  Config config;
  std::error_code ec;
  if (std::filesystem::exists(path.value(), ec)) {
    auto content = common::read_file(path.value());
    if (!content.ok()) {
      return common::Result<Config>::failure("Unable to open config file: " +
                                             path.value().string());
    }
    auto parsed = parse_config(content.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure("Invalid config " + path.value().string() + ": " +
                                             parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Status::error(path.error());
  }

  std::ostringstream out;
  out << "[agent]\n";
  out << "provider = " << common::quote_toml_string(config.agent.provider) << "\n";
  out << "model = " << common::quote_toml_string(config.agent.model) << "\n";
  out << "temperature = " << config.agent.temperature << "\n";
  out << "max_turns = " << config.agent.max_turns << "\n";
  if (!config.agent.system_prompt.empty()) {
    out << "system_prompt = " << common::quote_toml_string(config.agent.system_prompt) << "\n";
  }
  if (!config.agent.workspace.empty()) {
    out << "workspace = " << common::quote_toml_string(config.agent.workspace) << "\n";
  }
  out << "execution_mode = \"" << to_string(config.agent.execution_mode) << "\"\n";
  out << "scope = \"" << to_string(config.agent.scope) << "\"\n";
  if (config.agent.api_key.has_value()) {
    out << "api_key = " << common::quote_toml_string(*config.agent.api_key) << "\n";
  }

  out << "\n[planner]\n";
  out << "max_attempts = " << config.planner.max_attempts << "\n";
  out << "base_backoff_ms = " << config.planner.base_backoff_ms << "\n";
  out << "excerpt_chars = " << config.planner.excerpt_chars << "\n";

  out << "\n[router]\n";
  out << "use_llm_fallback = " << bool_to_toml(config.router.use_llm_fallback) << "\n";
  if (!config.router.fast_model.empty()) {
    out << "fast_model = " << common::quote_toml_string(config.router.fast_model) << "\n";
  }

  out << "\n[history]\n";
  out << "max_result_chars = " << config.history.max_result_chars << "\n";
  out << "max_history_chars = " << config.history.max_history_chars << "\n";

  out << "\n[sandbox]\n";
  if (!config.sandbox.image.empty()) {
    out << "image = " << common::quote_toml_string(config.sandbox.image) << "\n";
  }
  out << "memory_limit = " << common::quote_toml_string(config.sandbox.memory_limit) << "\n";
  out << "cpu_limit = " << config.sandbox.cpu_limit << "\n";
  out << "timeout_seconds = " << config.sandbox.timeout_seconds << "\n";
  out << "network_enabled = " << bool_to_toml(config.sandbox.network_enabled) << "\n";
  out << "docker_binary = " << common::quote_toml_string(config.sandbox.docker_binary) << "\n";

  out << "\n[permissions]\n";
  out << "autonomous = " << bool_to_toml(config.permissions.autonomous) << "\n";
  out << "cache_allow_always = " << bool_to_toml(config.permissions.cache_allow_always) << "\n";

  if (!config.store.path.empty()) {
    out << "\n[store]\n";
    out << "path = " << common::quote_toml_string(config.store.path) << "\n";
  }

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "level = " << common::quote_toml_string(config.observability.level) << "\n";

  const auto &providers = config.providers;
  out << "\n[providers]\n";
  const auto write_url = [&out](const char *key, const std::string &value) {
    if (!value.empty()) {
      out << key << " = " << common::quote_toml_string(value) << "\n";
    }
  };
  write_url("openai_base_url", providers.openai_base_url);
  write_url("anthropic_base_url", providers.anthropic_base_url);
  write_url("gemini_base_url", providers.gemini_base_url);
  write_url("ollama_base_url", providers.ollama_base_url);
  out << "max_retries = " << providers.max_retries << "\n";
  out << "retry_backoff_ms = " << providers.retry_backoff_ms << "\n";
  if (!providers.fallbacks.empty()) {
    out << "fallbacks = [";
    for (std::size_t i = 0; i < providers.fallbacks.size(); ++i) {
      out << (i == 0 ? "" : ", ") << common::quote_toml_string(providers.fallbacks[i]);
    }
    out << "]\n";
  }

  const std::filesystem::path tmp_path = path.value().string() + ".tmp";
  if (auto written = common::write_file(tmp_path, out.str()); !written.ok()) {
    return written;
  }
  std::error_code ec;
  std::filesystem::rename(tmp_path, path.value(), ec);
  if (ec) {
    return common::Status::error("Failed to replace config file: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  if (common::trim(config.agent.provider).empty()) {
    return common::Result<std::vector<std::string>>::failure("agent.provider must not be empty");
  }
  if (common::trim(config.agent.model).empty()) {
    return common::Result<std::vector<std::string>>::failure("agent.model must not be empty");
  }
  if (config.agent.max_turns == 0) {
    warnings.emplace_back("agent.max_turns is 0; the execution loop will never call a tool");
  }
  if (config.agent.temperature < 0.0 || config.agent.temperature > 2.0) {
    warnings.emplace_back("agent.temperature is outside [0, 2]");
  }
  if (config.planner.max_attempts == 0) {
    warnings.emplace_back("planner.max_attempts is 0; planning always fails");
  }
  if (config.sandbox.cpu_limit <= 0.0) {
    warnings.emplace_back("sandbox.cpu_limit must be positive");
  }
  if (config.sandbox.timeout_seconds == 0) {
    warnings.emplace_back("sandbox.timeout_seconds is 0; every command times out");
  }
  if (config.permissions.autonomous) {
    warnings.emplace_back("permissions.autonomous approves every privileged action");
  }
  if (config.history.max_result_chars > config.history.max_history_chars) {
    warnings.emplace_back("history.max_result_chars exceeds history.max_history_chars");
  }
  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::filesystem::path resolve_workspace(const Config &config) {
  if (!common::trim(config.agent.workspace).empty()) {
    return std::filesystem::path(common::expand_path(config.agent.workspace));
  }
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  return ec ? std::filesystem::path(".") : cwd;
}

common::Result<std::filesystem::path> resolve_store_path(const Config &config) {
  if (!common::trim(config.store.path).empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(config.store.path)));
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / STORE_FILENAME);
}

} // namespace cowork::config

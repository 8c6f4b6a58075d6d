#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cowork/config/config.hpp"

#include <cstdlib>

namespace {

void set_test_env(const char *name, const char *value) { setenv(name, value, 1); }
void unset_test_env(const char *name) { unsetenv(name); }

} // namespace

void register_config_tests(std::vector<cowork::tests::TestCase> &tests) {
  using cowork::tests::require;
  namespace cfg = cowork::config;

  tests.push_back({"config_defaults", [] {
                     cfg::Config config;
                     require(config.agent.execution_mode == cfg::ExecutionMode::Flexible,
                             "flexible by default");
                     require(config.planner.max_attempts == 3, "three planning attempts");
                     require(config.planner.base_backoff_ms == 1000, "1s base backoff");
                     require(config.agent.max_turns == 10, "ten tool steps");
                     require(config.providers.max_retries == 0, "provider retries off");
                   }});

  tests.push_back({"config_parse_sections", [] {
                     auto parsed = cfg::parse_config(
                         "[agent]\nprovider = \"anthropic\"\nmodel = \"claude\"\n"
                         "execution_mode = \"sandbox\"\nscope = \"workspace\"\nmax_turns = 4\n"
                         "[planner]\nmax_attempts = 5\nbase_backoff_ms = 10\n"
                         "[router]\nuse_llm_fallback = false\n"
                         "[sandbox]\nmemory_limit = \"512m\"\nnetwork_enabled = true\n"
                         "[providers]\nmax_retries = 2\nfallbacks = [\"openai\"]\n");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.agent.provider == "anthropic", "provider");
                     require(config.agent.execution_mode == cfg::ExecutionMode::Sandbox, "mode");
                     require(config.agent.scope == cfg::ScopeType::Workspace, "scope");
                     require(config.agent.max_turns == 4, "max turns");
                     require(config.planner.max_attempts == 5, "attempts");
                     require(config.planner.base_backoff_ms == 10, "backoff");
                     require(!config.router.use_llm_fallback, "router fallback");
                     require(config.sandbox.memory_limit == "512m", "memory");
                     require(config.sandbox.network_enabled, "network");
                     require(config.providers.max_retries == 2, "retries");
                     require(config.providers.fallbacks.size() == 1, "fallbacks");
                   }});

  tests.push_back({"config_rejects_unknown_execution_mode", [] {
                     auto parsed = cfg::parse_config("[agent]\nexecution_mode = \"yolo\"\n");
                     require(!parsed.ok(), "unknown mode should fail");
                     require(parsed.error().find("Unknown execution mode") != std::string::npos,
                             "error text: " + parsed.error());
                   }});

  tests.push_back({"config_save_then_load", [] {
                     cowork::testing::TempWorkspace ws;
                     cfg::set_config_path_override(ws.path() / "config.toml");
                     auto config = cowork::testing::temp_config(ws);
                     config.agent.execution_mode = cfg::ExecutionMode::Direct;
                     config.providers.fallbacks = {"anthropic", "gemini"};
                     config.router.fast_model = "tiny";
                     const auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(cfg::config_exists(), "config file should exist");

                     auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().agent.execution_mode == cfg::ExecutionMode::Direct,
                             "mode survives");
                     require(loaded.value().providers.fallbacks.size() == 2, "fallbacks survive");
                     require(loaded.value().router.fast_model == "tiny", "fast model survives");
                     require(loaded.value().agent.workspace == ws.path().string(),
                             "workspace survives");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     set_test_env("COWORK_PROVIDER", "gemini");
                     set_test_env("COWORK_EXECUTION_MODE", "direct");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     unset_test_env("COWORK_PROVIDER");
                     unset_test_env("COWORK_EXECUTION_MODE");
                     require(config.agent.provider == "gemini", "provider override");
                     require(config.agent.execution_mode == cfg::ExecutionMode::Direct,
                             "mode override");
                   }});

  tests.push_back({"config_validate_warnings", [] {
                     cfg::Config config;
                     config.permissions.autonomous = true;
                     config.agent.max_turns = 0;
                     auto warnings = cfg::validate_config(config);
                     require(warnings.ok(), warnings.error());
                     require(warnings.value().size() >= 2, "expected two warnings");

                     config.agent.provider = " ";
                     require(!cfg::validate_config(config).ok(), "empty provider is an error");
                   }});

  tests.push_back({"config_resolve_workspace", [] {
                     cowork::testing::TempWorkspace ws;
                     const auto config = cowork::testing::temp_config(ws);
                     require(cfg::resolve_workspace(config) == ws.path(), "configured workspace");
                     auto store = cfg::resolve_store_path(config);
                     require(store.ok(), store.error());
                     require(store.value().filename() == "jobs.db", "configured store path");
                   }});
}

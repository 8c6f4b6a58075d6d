#include "cowork/cli/commands.hpp"

#include "cowork/agent/coordinator.hpp"
#include "cowork/agent/router.hpp"
#include "cowork/common/fs.hpp"
#include "cowork/common/ids.hpp"
#include "cowork/config/config.hpp"
#include "cowork/events/channel.hpp"
#include "cowork/observability/factory.hpp"
#include "cowork/observability/global.hpp"
#include "cowork/observability/log.hpp"
#include "cowork/permissions/broker.hpp"
#include "cowork/permissions/handler.hpp"
#include "cowork/permissions/manager.hpp"
#include "cowork/providers/factory.hpp"
#include "cowork/sandbox/sandbox.hpp"
#include "cowork/skills/loader.hpp"
#include "cowork/skills/skill_tool.hpp"
#include "cowork/store/sqlite_store.hpp"
#include "cowork/tools/tool_registry.hpp"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace cowork::cli {

namespace {

std::string version_string() {
#ifdef COWORK_VERSION
  std::string version = COWORK_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "cowork " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

common::Result<config::Config> load_settings() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  const auto &obs = loaded.value().observability;
  observability::set_log_level(observability::log_level_from_string(obs.level));
  observability::set_global_observer(observability::create_observer(obs));
  if (auto warnings = config::validate_config(loaded.value()); warnings.ok()) {
    for (const auto &warning : warnings.value()) {
      observability::log_warn(warning);
    }
  }
  return loaded;
}

/// Prints events as they arrive and answers permission prompts from stdin.
class TerminalSession {
public:
  explicit TerminalSession(bool autonomous) : channel_(std::make_shared<events::EventChannel>()) {
    std::shared_ptr<permissions::IPermissionHandler> handler;
    if (autonomous) {
      handler = std::make_shared<permissions::AllowAllHandler>();
    } else {
      broker_ = std::make_shared<permissions::PermissionBroker>(channel_);
      handler = std::make_shared<permissions::BrokerHandler>(broker_);
    }
    permissions_ = std::make_shared<permissions::PermissionManager>(handler);
    subscription_ = channel_->subscribe(
        [this](const std::string &, const events::AgentEvent &event) { on_event(event); });
  }

  ~TerminalSession() { channel_->unsubscribe(subscription_); }

  TerminalSession(const TerminalSession &) = delete;
  TerminalSession &operator=(const TerminalSession &) = delete;

  [[nodiscard]] std::shared_ptr<events::EventChannel> channel() const { return channel_; }
  [[nodiscard]] std::shared_ptr<permissions::PermissionManager> permissions() const {
    return permissions_;
  }

  /// Denies whatever the finished run left waiting for an answer.
  void end_run(const std::string &session_id) {
    if (!broker_) {
      return;
    }
    if (const auto cancelled = broker_->cancel_session(session_id); cancelled > 0) {
      observability::log_warn("denied " + std::to_string(cancelled) +
                              " unanswered permission request(s)");
    }
  }

private:
  void on_event(const events::AgentEvent &event) {
    if (const auto *token = std::get_if<events::Token>(&event)) {
      std::cout << token->content << std::flush;
      return;
    }
    if (const auto *requested = std::get_if<events::PermissionRequested>(&event)) {
      answer(requested->request);
      return;
    }
    if (auto line = format_event(event)) {
      std::cout << "\n" << *line << "\n" << std::flush;
    }
  }

  void answer(const permissions::PermissionRequest &request) {
    if (!broker_) {
      return;
    }
    std::cout << "\n[permission] " << request.message << "\n"
              << "Allow? [y]es / [a]lways / [N]o: " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
      line.clear();
    }
    const auto response = parse_approval_answer(line);
    if (!broker_->resolve_response(request.id, response)) {
      observability::log_warn("permission request " + request.id + " was no longer pending");
    }
  }

  std::shared_ptr<events::EventChannel> channel_;
  std::shared_ptr<permissions::PermissionBroker> broker_;
  std::shared_ptr<permissions::PermissionManager> permissions_;
  events::EventChannel::SubscriptionId subscription_ = 0;
};

void register_skills(tools::ToolRegistry &registry, const std::filesystem::path &skills_dir,
                     const std::shared_ptr<sandbox::ISandbox> &isolated,
                     const std::shared_ptr<sandbox::ISandbox> &direct) {
  skills::SkillLoader loader;
  for (auto &loaded : loader.load_all(skills_dir)) {
    observability::log_info("registered skill " + loaded.skill.name);
    registry.register_tool(std::make_unique<skills::SkillTool>(std::move(loaded), isolated, direct));
  }
}

int run_agent(std::vector<std::string> args) {
  std::string message;
  std::string mode_raw = "smart";
  std::string execution_raw;
  std::string skills_dir;
  std::string session_id;
  (void)take_option(args, "--message", "-m", message);
  (void)take_option(args, "--mode", "", mode_raw);
  (void)take_option(args, "--execution", "", execution_raw);
  (void)take_option(args, "--skills", "", skills_dir);
  (void)take_option(args, "--session", "", session_id);
  const bool autonomous_flag = take_flag(args, "--autonomous");
  if (message.empty() && !args.empty()) {
    message = join_tokens(args);
  }

  auto mode = agent::run_mode_from_string(mode_raw);
  if (!mode.ok()) {
    std::cerr << mode.error() << "\n";
    return 1;
  }

  auto loaded = load_settings();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  config::Config config = std::move(loaded.value());
  if (!execution_raw.empty()) {
    auto execution = config::execution_mode_from_string(execution_raw);
    if (!execution.ok()) {
      std::cerr << execution.error() << "\n";
      return 1;
    }
    config.agent.execution_mode = execution.value();
  }

  auto provider = providers::create_provider(config);
  if (!provider.ok()) {
    std::cerr << provider.error() << "\n";
    return 1;
  }

  auto process_runner = std::make_shared<sandbox::PosixProcessRunner>();
  auto docker = std::make_shared<sandbox::DockerSandbox>(
      process_runner, config.sandbox.docker_binary,
      config.sandbox.image.empty() ? sandbox::DockerSandbox::kDefaultImage : config.sandbox.image);
  auto native = std::make_shared<sandbox::NativeSandbox>(process_runner);
  auto session_sandbox = sandbox::create_sandbox(config.agent.execution_mode, docker, native);
  if (!session_sandbox.ok()) {
    std::cerr << session_sandbox.error() << "\n";
    return 1;
  }

  auto registry = std::make_shared<tools::ToolRegistry>(tools::ToolRegistry::create_default());
  if (!skills_dir.empty()) {
    register_skills(*registry, common::expand_path(skills_dir), docker, native);
  }

  std::shared_ptr<store::IJobStore> job_store;
  if (auto path = config::resolve_store_path(config); path.ok()) {
    auto sqlite = std::make_shared<store::SqliteJobStore>(path.value());
    if (sqlite->status().ok()) {
      job_store = sqlite;
    } else {
      observability::log_warn("job history disabled: " + sqlite->status().error());
    }
  } else {
    observability::log_warn("job history disabled: " + path.error());
  }

  const bool resumed = !session_id.empty();
  if (!resumed) {
    session_id = common::new_uuid();
  }

  TerminalSession terminal(autonomous_flag || config.permissions.autonomous);
  agent::Coordinator coordinator(config, session_id,
                                 agent::CoordinatorDependencies{
                                     .provider = provider.value(),
                                     .tools = registry,
                                     .sink = terminal.channel(),
                                     .permissions = terminal.permissions(),
                                     .sandbox = session_sandbox.value(),
                                     .store = job_store,
                                 });
  if (resumed) {
    if (auto restored = coordinator.restore_history(); !restored.ok()) {
      observability::log_warn("could not restore session " + session_id + ": " +
                              restored.error());
    }
  }

  if (!message.empty()) {
    const auto result = coordinator.run(message, mode.value());
    terminal.end_run(session_id);
    std::cout << "\n";
    return result.success() ? 0 : 1;
  }

  std::cout << "cowork session " << session_id << " (" << agent::to_string(mode.value())
            << " mode, " << config::to_string(config.agent.execution_mode)
            << " execution). Type 'exit' to quit.\n";
  std::string line;
  while (true) {
    std::cout << "\n> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    const std::string input = common::trim(line);
    if (input.empty()) {
      continue;
    }
    if (input == "exit" || input == "quit") {
      break;
    }
    (void)coordinator.run(input, mode.value());
    terminal.end_run(session_id);
    std::cout << "\n";
  }
  return 0;
}

int run_classify(std::vector<std::string> args) {
  const bool offline = take_flag(args, "--offline");
  const std::string query = common::trim(join_tokens(args));
  if (query.empty()) {
    std::cerr << "usage: cowork classify [--offline] <text>\n";
    return 1;
  }
  if (offline) {
    const auto by_marker = agent::classify_by_markers(query);
    std::cout << (by_marker.has_value() ? agent::to_string(*by_marker) : "unknown") << "\n";
    return 0;
  }

  auto loaded = load_settings();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  const auto &config = loaded.value();
  std::shared_ptr<providers::Provider> provider;
  if (config.router.use_llm_fallback) {
    auto created = providers::create_provider(config);
    if (!created.ok()) {
      std::cerr << created.error() << "\n";
      return 1;
    }
    provider = created.value();
  }
  const std::string fast = config.router.fast_model.empty()
                               ? providers::fast_model(config.agent.provider)
                               : config.router.fast_model;
  const agent::Router router(provider, fast, config.router.use_llm_fallback);
  std::cout << agent::to_string(router.classify(query)) << "\n";
  return 0;
}

int run_skills(std::vector<std::string> args) {
  if (args.size() < 2 || (args[0] != "list" && args[0] != "show")) {
    std::cerr << "usage: cowork skills list <dir> | cowork skills show <path>\n";
    return 1;
  }
  const skills::SkillLoader loader;
  const auto path = common::expand_path(args[1]);

  if (args[0] == "list") {
    auto listed = loader.list_marketplace_skills(path);
    if (!listed.ok()) {
      std::cerr << listed.error() << "\n";
      return 1;
    }
    for (const auto &info : listed.value()) {
      std::cout << info.name;
      if (info.category.has_value()) {
        std::cout << " [" << *info.category << "]";
      }
      std::cout << " - " << info.display_title << "\n";
    }
    return 0;
  }

  auto loaded = loader.load(path);
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  const auto &skill = loaded.value().skill;
  std::cout << "name: " << skill.name << "\n";
  std::cout << "description: " << skill.description << "\n";
  if (skill.category.has_value()) {
    std::cout << "category: " << *skill.category << "\n";
  }
  std::cout << "requires_sandbox: " << (skill.requires_sandbox ? "true" : "false") << "\n";
  if (skill.execution_mode.has_value()) {
    std::cout << "execution_mode: " << *skill.execution_mode << "\n";
  }
  if (skill.triggers.has_value() && !skill.triggers->empty()) {
    std::cout << "triggers: " << join_tokens(*skill.triggers) << "\n";
  }
  std::cout << "files:\n";
  for (const auto &[relative, file] : loaded.value().files) {
    std::cout << "  " << relative << " (" << file.file_type << ")\n";
  }
  return 0;
}

int run_jobs(std::vector<std::string> args) {
  std::string session;
  (void)take_option(args, "--session", "", session);

  auto loaded = load_settings();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  auto path = config::resolve_store_path(loaded.value());
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }
  store::SqliteJobStore job_store(path.value());
  if (auto status = job_store.status(); !status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  auto jobs = job_store.list_jobs(session.empty() ? std::nullopt
                                                  : std::optional<std::string>(session));
  if (!jobs.ok()) {
    std::cerr << jobs.error() << "\n";
    return 1;
  }
  for (const auto &record : jobs.value()) {
    const auto &job = record.job;
    std::cout << job.created_at << "  " << job.id << "  " << events::to_string(job.status)
              << "  steps=" << job.steps.size() << "  " << job.query << "\n";
    if (!record.message.empty()) {
      std::cout << "    " << record.message << "\n";
    }
  }
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  cowork" << RESET << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "cowork [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  AGENT" << RESET << "\n";
  std::cout << "  " << GREEN << "run" << RESET << DIM << "            Interactive session" << RESET
            << "\n";
  std::cout << "  " << GREEN << "run -m" << RESET << " MSG" << DIM
            << "    Run a single message and exit" << RESET << "\n";
  std::cout << DIM << "                 --mode fast|smart  --execution sandbox|direct|flexible\n"
            << "                 --autonomous  --skills DIR  --session ID" << RESET << "\n";
  std::cout << "  " << GREEN << "classify" << RESET << " TEXT" << DIM
            << "  Show whether a request is simple or complex (--offline: markers only)"
            << RESET << "\n\n";

  std::cout << BOLD << "  SKILLS" << RESET << "\n";
  std::cout << "  " << GREEN << "skills list" << RESET << " DIR" << DIM
            << "   List skills in a directory" << RESET << "\n";
  std::cout << "  " << GREEN << "skills show" << RESET << " PATH" << DIM
            << "  Show a skill directory or .zip" << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "jobs" << RESET << DIM << "           List recorded jobs (--session ID)"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET
            << "\n\n";
}

} // namespace

permissions::PermissionResponse parse_approval_answer(const std::string &answer) {
  const std::string normalized = common::to_lower(common::trim(answer));
  if (normalized == "y" || normalized == "yes") {
    return permissions::PermissionResponse::Allow;
  }
  if (normalized == "a" || normalized == "always") {
    return permissions::PermissionResponse::AllowAlways;
  }
  return permissions::PermissionResponse::Deny;
}

std::optional<std::string> format_event(const events::AgentEvent &event) {
  if (const auto *token = std::get_if<events::Token>(&event)) {
    return token->content;
  }
  if (const auto *thinking = std::get_if<events::Thinking>(&event)) {
    return "... " + thinking->message;
  }
  if (const auto *started = std::get_if<events::StepStarted>(&event)) {
    return "-> " + started->step.tool_name + " " + started->step.tool_args;
  }
  if (const auto *completed = std::get_if<events::StepCompleted>(&event)) {
    return "<- " + completed->step.tool_name + " [" +
           std::string(events::to_string(completed->step.status)) + "]";
  }
  if (const auto *approval = std::get_if<events::ApprovalRequired>(&event)) {
    return "?  " + approval->step.tool_name + " needs approval";
  }
  if (const auto *rejected = std::get_if<events::StepRejected>(&event)) {
    return "x  " + rejected->step.tool_name + " rejected";
  }
  if (const auto *error = std::get_if<events::Error>(&event)) {
    return "error: " + error->message;
  }
  if (const auto *update = std::get_if<events::PlanUpdate>(&event)) {
    std::string out = "plan:";
    for (const auto &task : update->plan.tasks) {
      out += "\n  [" + std::string(events::to_string(task.status)) + "] " + task.description;
    }
    return out;
  }
  if (const auto *done = std::get_if<events::JobCompleted>(&event)) {
    return "job " + std::string(events::to_string(done->job.status)) +
           (done->message.empty() ? std::string() : ": " + done->message);
  }
  return std::nullopt;
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_agent(std::move(args));
  }
  if (subcommand == "classify") {
    return run_classify(std::move(args));
  }
  if (subcommand == "skills") {
    return run_skills(std::move(args));
  }
  if (subcommand == "jobs") {
    return run_jobs(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace cowork::cli

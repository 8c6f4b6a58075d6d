#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cowork/sandbox/process.hpp"
#include "cowork/sandbox/sandbox.hpp"

#include <algorithm>

namespace {

namespace sb = cowork::sandbox;

bool contains(const std::vector<std::string> &args, const std::string &value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

/// The trailing `timeout <seconds> /bin/sh -c <command>` of a docker run invocation.
std::vector<std::string> in_container(const std::vector<std::string> &args) {
  return args.size() < 5 ? args : std::vector<std::string>(args.end() - 5, args.end());
}

std::shared_ptr<cowork::testing::FakeProcessRunner> docker_runner(int probe_exit) {
  auto runner = std::make_shared<cowork::testing::FakeProcessRunner>();
  runner->next.exit_code = probe_exit;
  return runner;
}

} // namespace

void register_sandbox_tests(std::vector<cowork::tests::TestCase> &tests) {
  using cowork::tests::require;

  tests.push_back({"sandbox_config_defaults_and_builders", [] {
                     const auto defaults = sb::SandboxConfig::defaults();
                     require(defaults.memory_or_default() == "256m", "default memory");
                     require(defaults.timeout_or_default() == 300, "default timeout");
                     require(!defaults.network_or_default(), "network off by default");
                     auto custom = sb::SandboxConfig::defaults();
                     custom.with_memory_limit("1g").with_timeout(5).with_network(true);
                     require(custom.memory_or_default() == "1g", "memory override");
                     require(custom.timeout_or_default() == 5, "timeout override");
                     require(custom.network_or_default(), "network override");
                     require(sb::SandboxConfig{}.cpu_or_default() == 0.5, "unset cpu falls back");
                   }});

  tests.push_back({"sandbox_resolve_image_aliases", [] {
                     require(sb::resolve_image("python") == "python:3.11-slim", "python alias");
                     require(sb::resolve_image("node20") == "node:20-slim", "node alias");
                     require(sb::resolve_image("anycowork") == "anycowork/skill-runner:latest",
                             "runner alias");
                     require(sb::resolve_image(" ubuntu:22.04 ") == "ubuntu:22.04", "verbatim");
                   }});

  tests.push_back({"sandbox_execution_result_timeout_exit_code", [] {
                     const auto timed = sb::ExecutionResult::from_exit(124, "", "");
                     require(timed.timed_out && !timed.success, "124 is a timeout");
                     const auto ok = sb::ExecutionResult::from_exit(0, "out", "");
                     require(ok.success && ok.stdout_text == "out", "zero exit succeeds");
                     require(sb::ExecutionResult::timeout().exit_code == sb::kTimeoutExitCode,
                             "timeout exit code");
                   }});

  tests.push_back({"sandbox_docker_run_args_isolated_by_default", [] {
                     sb::DockerSandbox docker(docker_runner(0));
                     const auto args = docker.build_run_args(
                         "ls", "/work", std::optional<std::filesystem::path>("/skill-files"),
                         sb::SandboxConfig::defaults());
                     require(args.front() == "run" && contains(args, "--rm"), "run --rm");
                     require(contains(args, "--memory=256m"), "memory limit");
                     require(contains(args, "--cpus=0.5"), "cpu limit");
                     require(contains(args, "--network=none"), "network disabled");
                     require(contains(args, "--read-only"), "read-only rootfs");
                     require(contains(args, "/work:/workspace:rw"), "workspace mount");
                     require(contains(args, "/skill-files:/skill:ro"), "skill mount read-only");
                     require(contains(args, sb::SandboxConfig::kDefaultImage), "configured image");
                     require(in_container(args) ==
                                 std::vector<std::string>{"timeout", "300", "/bin/sh", "-c", "ls"},
                             "in-band timeout wraps the shell");
                   }});

  tests.push_back({"sandbox_docker_run_args_network_and_image", [] {
                     sb::DockerSandbox docker(docker_runner(0));
                     auto config = sb::SandboxConfig::defaults();
                     config.with_network(true).with_image("node").with_timeout(9);
                     const auto args = docker.build_run_args("npm test", "/w", std::nullopt, config);
                     require(!contains(args, "--network=none"), "network enabled");
                     require(contains(args, "node:20-slim"), "alias resolved");
                     require(!contains(args, "/skill-files:/skill:ro"), "no skill mount");
                     require(in_container(args) == std::vector<std::string>{"timeout", "9", "/bin/sh",
                                                                            "-c", "npm test"},
                             "timeout propagated");
                   }});

  tests.push_back({"sandbox_docker_image_falls_back_to_backend_default", [] {
                     sb::DockerSandbox standard(docker_runner(0));
                     const auto unset = standard.build_run_args("ls", "/w", std::nullopt,
                                                                sb::SandboxConfig{});
                     require(contains(unset, sb::DockerSandbox::kDefaultImage), "python default");
                     sb::DockerSandbox custom(docker_runner(0), "docker", "alpine:custom");
                     require(contains(custom.build_run_args("ls", "/w", std::nullopt,
                                                            sb::SandboxConfig{}),
                                      "alpine:custom"),
                             "constructor default");
                     require(!contains(custom.build_run_args("ls", "/w", std::nullopt,
                                                             sb::SandboxConfig::defaults()),
                                       "alpine:custom"),
                             "an explicit image wins");
                   }});

  tests.push_back({"sandbox_docker_compound_command_stays_one_argument", [] {
                     sb::DockerSandbox docker(docker_runner(0));
                     const auto args = docker.build_run_args("cd sub && make; echo done", "/w",
                                                             std::nullopt, sb::SandboxConfig{});
                     require(args.back() == "cd sub && make; echo done", args.back());
                     require(in_container(args).front() == "timeout", "timeout runs the shell");
                   }});

  tests.push_back({"sandbox_config_from_settings_and_layering", [] {
                     cowork::config::SandboxSettings settings;
                     settings.memory_limit = "1g";
                     settings.cpu_limit = 2.0;
                     settings.timeout_seconds = 42;
                     settings.network_enabled = true;
                     auto base = sb::config_from_settings(settings);
                     require(!base.image.has_value(), "empty image stays unset");
                     require(base.memory_or_default() == "1g" && base.cpu_or_default() == 2.0,
                             "limits copied");
                     require(base.timeout_or_default() == 42 && base.network_or_default(),
                             "timeout and network copied");
                     settings.image = " node ";
                     require(sb::config_from_settings(settings).image == std::string("node"),
                             "image trimmed");

                     sb::SandboxConfig overrides;
                     overrides.with_timeout(7);
                     const auto layered = overrides.layered_on(base);
                     require(layered.timeout_or_default() == 7, "override wins");
                     require(layered.memory_or_default() == "1g", "base fills the rest");
                   }});

  tests.push_back({"sandbox_docker_availability_probe_is_cached", [] {
                     auto runner = docker_runner(1);
                     sb::DockerSandbox docker(runner, "docker-missing");
                     require(!docker.is_available(), "nonzero probe means unavailable");
                     require(!docker.is_available(), "still unavailable");
                     require(runner->calls.size() == 1, "probed once");
                     require(runner->calls[0] == std::vector<std::string>{"docker-missing", "--version"},
                             "probe argv");
                   }});

  tests.push_back({"sandbox_docker_unavailable_execute_fails", [] {
                     auto runner = docker_runner(0);
                     runner->next_error = "not found";
                     sb::DockerSandbox docker(runner);
                     cowork::testing::TempWorkspace ws;
                     auto run = docker.execute("ls", ws.path(), sb::SandboxConfig::defaults());
                     require(!run.ok(), "execute should fail");
                     require(run.error() == "Docker is not available", run.error());
                   }});

  tests.push_back({"sandbox_docker_execute_runs_container", [] {
                     auto runner = docker_runner(0);
                     runner->next.stdout_text = "hello\n";
                     sb::DockerSandbox docker(runner);
                     cowork::testing::TempWorkspace ws;
                     auto run = docker.execute("echo hello", ws.path(), sb::SandboxConfig::defaults());
                     require(run.ok(), run.error());
                     require(run.value().success && run.value().stdout_text == "hello\n", "output");
                     require(runner->calls.size() == 2, "probe then run");
                     const auto &argv = runner->calls[1];
                     require(argv[0] == "docker" && argv[1] == "run", "docker run argv");
                     const auto canonical = std::filesystem::canonical(ws.path()).string();
                     require(contains(argv, canonical + ":/workspace:rw"), "canonical workspace mount");
                   }});

  tests.push_back({"sandbox_docker_killed_process_is_timeout", [] {
                     auto runner = docker_runner(0);
                     sb::DockerSandbox docker(runner);
                     require(docker.is_available(), "available");
                     runner->next.killed = true;
                     runner->next.exit_code = -1;
                     cowork::testing::TempWorkspace ws;
                     auto run = docker.execute("sleep 999", ws.path(), sb::SandboxConfig::defaults());
                     require(run.ok(), run.error());
                     require(run.value().timed_out && !run.value().success, "timed out");
                   }});

  tests.push_back({"sandbox_native_argv_and_env", [] {
                     auto runner = std::make_shared<cowork::testing::FakeProcessRunner>();
                     runner->next.exit_code = 3;
                     runner->next.stderr_text = "bad";
                     sb::NativeSandbox native(runner);
                     auto config = sb::SandboxConfig::defaults();
                     config.with_timeout(7);
                     auto run = native.execute_with_files("make", "/ws", std::filesystem::path("/files"),
                                                          config);
                     require(run.ok(), run.error());
                     require(!run.value().success && run.value().exit_code == 3, "failed command");
                     require(run.value().stderr_text == "bad", "stderr kept");
                     const std::vector<std::string> expected = {"timeout", "7", "bash", "-c", "make"};
                     require(runner->calls.at(0) == expected, "native argv");
                     require(runner->options.at(0).working_dir == "/ws", "working dir");
                     const auto &env = runner->options.at(0).env;
                     require(env.size() == 1 && env[0].first == "SKILL_FILES_PATH" &&
                                 env[0].second == "/files",
                             "skill files env");
                   }});

  tests.push_back({"sandbox_create_by_execution_mode", [] {
                     auto native = std::make_shared<sb::NativeSandbox>(
                         std::make_shared<cowork::testing::FakeProcessRunner>());
                     auto missing = std::make_shared<sb::DockerSandbox>(docker_runner(127));
                     auto strict = sb::create_sandbox(cowork::config::ExecutionMode::Sandbox, missing, native);
                     require(!strict.ok(), "sandbox mode needs docker");
                     auto flexible =
                         sb::create_sandbox(cowork::config::ExecutionMode::Flexible, missing, native);
                     require(flexible.ok() && flexible.value()->name() == "native", "falls back");
                     auto present = std::make_shared<sb::DockerSandbox>(docker_runner(0));
                     auto preferred =
                         sb::create_sandbox(cowork::config::ExecutionMode::Flexible, present, native);
                     require(preferred.ok() && preferred.value()->name() == "docker", "prefers docker");
                     auto direct = sb::create_sandbox(cowork::config::ExecutionMode::Direct, present, native);
                     require(direct.ok() && direct.value()->name() == "native", "direct is native");
                   }});

  tests.push_back({"sandbox_posix_runner_captures_output", [] {
                     sb::PosixProcessRunner runner;
                     sb::ProcessOptions options;
                     auto run = runner.run({"sh", "-c", "echo out; echo err >&2; exit 4"}, options);
                     require(run.ok(), run.error());
                     require(run.value().stdout_text == "out\n", "stdout: " + run.value().stdout_text);
                     require(run.value().stderr_text == "err\n", "stderr");
                     require(run.value().exit_code == 4, "exit code");
                     require(!runner.run({}, options).ok(), "empty argv fails");
                   }});

  tests.push_back({"sandbox_posix_runner_kills_on_timeout", [] {
                     sb::PosixProcessRunner runner;
                     sb::ProcessOptions options;
                     options.timeout = std::chrono::milliseconds(200);
                     auto run = runner.run({"sleep", "5"}, options);
                     require(run.ok(), run.error());
                     require(run.value().killed, "process should be killed");
                   }});

  tests.push_back({"sandbox_native_real_command", [] {
                     cowork::testing::TempWorkspace ws;
                     ws.create_file("data.txt", "payload");
                     sb::NativeSandbox native;
                     auto run = native.execute("cat data.txt", ws.path(), sb::SandboxConfig::defaults());
                     require(run.ok(), run.error());
                     require(run.value().success, "cat should succeed: " + run.value().stderr_text);
                     require(run.value().stdout_text == "payload", "workspace is cwd");
                   }});
}

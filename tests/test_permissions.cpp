#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cowork/permissions/broker.hpp"
#include "cowork/permissions/handler.hpp"
#include "cowork/permissions/manager.hpp"
#include "cowork/permissions/scope.hpp"

#include <chrono>
#include <thread>

namespace {

namespace perm = cowork::permissions;

class CountingHandler final : public perm::IPermissionHandler {
public:
  explicit CountingHandler(perm::PermissionResponse answer) : answer_(answer) {}

  [[nodiscard]] cowork::common::Result<perm::PermissionResponse>
  request_permission(const perm::PermissionRequest &) override {
    ++calls;
    return cowork::common::Result<perm::PermissionResponse>::success(answer_);
  }

  int calls = 0;

private:
  perm::PermissionResponse answer_;
};

perm::PermissionRequest shell_request(const std::string &session, const std::string &command) {
  auto request = perm::PermissionRequest::create(perm::PermissionType::ShellExecute, "run " + command);
  request.with_session_id(session).with_resource(command);
  return request;
}

} // namespace

void register_permissions_tests(std::vector<cowork::tests::TestCase> &tests) {
  using cowork::tests::require;

  tests.push_back({"permissions_cache_key_shape", [] {
                     auto request = shell_request("s1", "ls");
                     require(request.cache_key() == "s1:shell_execute:ls", request.cache_key());
                     auto bare = perm::PermissionRequest::create(perm::PermissionType::Network, "x");
                     require(bare.cache_key() == "network:global", bare.cache_key());
                     require(request.id != bare.id, "ids are unique");
                   }});

  tests.push_back({"permissions_response_names", [] {
                     auto parsed = perm::permission_response_from_string(" Allow_Always ");
                     require(parsed.ok() && parsed.value() == perm::PermissionResponse::AllowAlways,
                             "allow_always parses");
                     require(!perm::permission_response_from_string("maybe").ok(),
                             "unknown response");
                     require(perm::is_allowed(perm::PermissionResponse::AllowAlways), "allowed");
                     require(!perm::should_cache(perm::PermissionResponse::Allow),
                             "plain allow is not cached");
                     require(perm::permission_type_from_string("bogus") ==
                                 perm::PermissionType::Unknown,
                             "unknown type");
                   }});

  tests.push_back({"permissions_manager_caches_allow_always_only", [] {
                     auto always = std::make_shared<CountingHandler>(perm::PermissionResponse::AllowAlways);
                     perm::PermissionManager manager(always);
                     for (int i = 0; i < 3; ++i) {
                       auto allowed = manager.check(shell_request("s1", "ls"));
                       require(allowed.ok() && allowed.value(), "allowed");
                     }
                     require(always->calls == 1, "handler asked once");
                     require(manager.cache_size() == 1, "one cached decision");

                     auto once = std::make_shared<CountingHandler>(perm::PermissionResponse::Allow);
                     perm::PermissionManager uncached(once);
                     (void)uncached.check(shell_request("s1", "ls"));
                     (void)uncached.check(shell_request("s1", "ls"));
                     require(once->calls == 2, "plain allow asks every time");
                   }});

  tests.push_back({"permissions_manager_session_cache_clear", [] {
                     auto always = std::make_shared<CountingHandler>(perm::PermissionResponse::AllowAlways);
                     perm::PermissionManager manager(always);
                     (void)manager.check(shell_request("s1", "ls"));
                     (void)manager.check(shell_request("s2", "ls"));
                     manager.clear_session_cache("s1");
                     require(manager.cache_size() == 1, "only s2 remains");
                     manager.pre_approve("s3:network:global");
                     require(manager.cache_size() == 2, "pre-approved key cached");
                   }});

  tests.push_back({"permissions_manager_without_handler_fails", [] {
                     perm::PermissionManager manager(nullptr);
                     require(!manager.check(shell_request("s", "ls")).ok(), "no handler is an error");
                   }});

  tests.push_back({"permissions_broker_without_sink_denies", [] {
                     perm::PermissionBroker broker;
                     auto future = broker.submit(shell_request("s", "ls"));
                     require(future.get() == perm::PermissionResponse::Deny, "denied");
                     require(broker.pending_count() == 0, "nothing pending");
                   }});

  tests.push_back({"permissions_broker_emits_and_resolves", [] {
                     auto sink = std::make_shared<cowork::testing::RecordingSink>();
                     perm::PermissionBroker broker(sink);
                     auto request = shell_request("abc", "make");
                     const std::string id = request.id;
                     auto future = broker.submit(request);
                     require(broker.list_pending().size() == 1, "one pending");
                     const auto events = sink->events();
                     require(events.size() == 1, "one event");
                     require(events[0].first == "session:abc", "session channel");
                     require(sink->count("permission_request") == 1, "event type");

                     require(broker.resolve_response(id, perm::PermissionResponse::Allow),
                             "first resolution");
                     require(!broker.resolve_response(id, perm::PermissionResponse::Deny),
                             "second resolution is a no-op");
                     require(future.get() == perm::PermissionResponse::Allow, "allowed");
                     require(!broker.resolve("missing", true), "unknown id");
                   }});

  tests.push_back({"permissions_broker_sessionless_channel", [] {
                     auto sink = std::make_shared<cowork::testing::RecordingSink>();
                     perm::PermissionBroker broker(sink);
                     auto request = perm::PermissionRequest::create(perm::PermissionType::Network, "fetch");
                     auto future = broker.submit(request);
                     require(sink->events().at(0).first == "permission_request", "global channel");
                     require(broker.resolve(request.id, false), "resolved");
                     require(future.get() == perm::PermissionResponse::Deny, "denied");
                   }});

  tests.push_back({"permissions_broker_blocking_request_from_other_thread", [] {
                     auto sink = std::make_shared<cowork::testing::RecordingSink>();
                     auto broker = std::make_shared<perm::PermissionBroker>(sink);
                     std::thread resolver([broker] {
                       for (int i = 0; i < 500 && broker->pending_count() == 0; ++i) {
                         std::this_thread::sleep_for(std::chrono::milliseconds(2));
                       }
                       for (const auto &id : broker->list_pending()) {
                         (void)broker->resolve(id, true);
                       }
                     });
                     const bool allowed = broker->request(shell_request("s", "ls"));
                     resolver.join();
                     require(allowed, "resolved from another thread");
                   }});

  tests.push_back({"permissions_broker_cancel_session", [] {
                     auto sink = std::make_shared<cowork::testing::RecordingSink>();
                     perm::PermissionBroker broker(sink);
                     auto mine = broker.submit(shell_request("s1", "a"));
                     auto other = broker.submit(shell_request("s2", "b"));
                     require(broker.cancel_session("s1") == 1, "one cancelled");
                     require(mine.get() == perm::PermissionResponse::Deny, "cancelled is denied");
                     require(broker.pending_count() == 1, "other session still pending");
                     const auto left = broker.list_pending();
                     (void)broker.resolve(left.at(0), true);
                     require(other.get() == perm::PermissionResponse::Allow, "other allowed");
                   }});

  tests.push_back({"permissions_autonomous_broker_allows", [] {
                     perm::AutonomousBroker broker;
                     require(broker.request(shell_request("s", "rm x")), "auto approved");
                     require(broker.list_pending().empty(), "never pending");
                   }});

  tests.push_back({"permissions_broker_handler_roundtrip", [] {
                     auto handler = std::make_shared<perm::BrokerHandler>(
                         std::make_shared<perm::AutonomousBroker>());
                     perm::PermissionManager manager(handler);
                     auto allowed = manager.check(shell_request("s", "ls"));
                     require(allowed.ok() && allowed.value(), "allowed through broker");
                     perm::PermissionManager denying(std::make_shared<perm::DenyAllHandler>());
                     auto denied = denying.check(shell_request("s", "ls"));
                     require(denied.ok() && !denied.value(), "denied");
                   }});

  tests.push_back({"permissions_scope_workspace_paths", [] {
                     cowork::testing::TempWorkspace ws;
                     ws.create_file("a/b.txt", "x");
                     const auto scope = perm::ScopeEnforcer::workspace(ws.path());
                     require(scope.is_path_allowed(ws.path() / "a" / "b.txt"), "inside file");
                     require(scope.is_path_allowed(ws.path() / "a" / "new.txt"), "new file inside");
                     require(!scope.is_path_allowed("/etc/passwd"), "outside file");
                     require(perm::ScopeEnforcer::global().is_path_allowed("/etc/passwd"),
                             "global allows everything");
                   }});

  tests.push_back({"permissions_scope_commands", [] {
                     cowork::testing::TempWorkspace ws;
                     const auto scope = perm::ScopeEnforcer::workspace(ws.path());
                     require(scope.validate_command("ls -la").ok(), "plain command");
                     require(!scope.validate_command("cd .. && ls").ok(), "escape pattern");
                     require(!scope.validate_command("cat /etc/hosts").ok(), "outside path");
                     require(scope.validate_command("cat " + (ws.path() / "x").string()).ok(),
                             "absolute path inside workspace");
                     const perm::ScopeEnforcer no_root(cowork::config::ScopeType::Workspace,
                                                       std::nullopt);
                     require(!no_root.validate_command("ls").ok(), "workspace scope needs a root");
                   }});
}

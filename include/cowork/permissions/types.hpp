#pragma once

#include "cowork/common/result.hpp"

#include <map>
#include <string>
#include <string_view>

namespace cowork::permissions {

enum class PermissionType { FilesystemRead, FilesystemWrite, ShellExecute, Network, Unknown };

[[nodiscard]] std::string_view to_string(PermissionType type);
/// Unrecognized names map to Unknown.
[[nodiscard]] PermissionType permission_type_from_string(const std::string &value);

/// A gate on one privileged action. `metadata` conventionally carries `session_id`,
/// `resource` and tool specific keys such as `operation`.
struct PermissionRequest {
  std::string id;
  PermissionType permission_type = PermissionType::Unknown;
  std::string message;
  std::map<std::string, std::string> metadata;

  /// Fresh request with a random id.
  [[nodiscard]] static PermissionRequest create(PermissionType type, std::string message);

  PermissionRequest &with_metadata(const std::string &key, std::string value);
  PermissionRequest &with_session_id(std::string session_id);
  PermissionRequest &with_resource(std::string resource);

  [[nodiscard]] std::string session_id() const;
  [[nodiscard]] std::string resource() const;

  /// `[<session_id>:]<type>:<resource|global>`
  [[nodiscard]] std::string cache_key() const;

  [[nodiscard]] std::string to_json() const;
};

enum class PermissionResponse { Allow, Deny, AllowAlways };

[[nodiscard]] std::string_view to_string(PermissionResponse response);
[[nodiscard]] common::Result<PermissionResponse>
permission_response_from_string(const std::string &value);
[[nodiscard]] bool is_allowed(PermissionResponse response);
[[nodiscard]] bool should_cache(PermissionResponse response);

} // namespace cowork::permissions

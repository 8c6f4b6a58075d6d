#include "cowork/permissions/types.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/common/ids.hpp"
#include "cowork/common/json_util.hpp"

#include <sstream>

namespace cowork::permissions {

std::string_view to_string(PermissionType type) {
  switch (type) {
  case PermissionType::FilesystemRead:
    return "filesystem_read";
  case PermissionType::FilesystemWrite:
    return "filesystem_write";
  case PermissionType::ShellExecute:
    return "shell_execute";
  case PermissionType::Network:
    return "network";
  case PermissionType::Unknown:
    break;
  }
  return "unknown";
}

PermissionType permission_type_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "filesystem_read") {
    return PermissionType::FilesystemRead;
  }
  if (normalized == "filesystem_write") {
    return PermissionType::FilesystemWrite;
  }
  if (normalized == "shell_execute") {
    return PermissionType::ShellExecute;
  }
  if (normalized == "network") {
    return PermissionType::Network;
  }
  return PermissionType::Unknown;
}

PermissionRequest PermissionRequest::create(PermissionType type, std::string message) {
  PermissionRequest request;
  request.id = common::new_uuid();
  request.permission_type = type;
  request.message = std::move(message);
  return request;
}

PermissionRequest &PermissionRequest::with_metadata(const std::string &key, std::string value) {
  metadata[key] = std::move(value);
  return *this;
}

PermissionRequest &PermissionRequest::with_session_id(std::string session_id) {
  return with_metadata("session_id", std::move(session_id));
}

PermissionRequest &PermissionRequest::with_resource(std::string resource) {
  return with_metadata("resource", std::move(resource));
}

std::string PermissionRequest::session_id() const {
  const auto it = metadata.find("session_id");
  return it == metadata.end() ? std::string() : it->second;
}

std::string PermissionRequest::resource() const {
  const auto it = metadata.find("resource");
  return it == metadata.end() ? std::string() : it->second;
}

std::string PermissionRequest::cache_key() const {
  std::string key;
  if (const auto session = metadata.find("session_id"); session != metadata.end()) {
    key = session->second + ":";
  }
  const auto res = metadata.find("resource");
  key += std::string(to_string(permission_type)) + ":" +
         (res == metadata.end() ? std::string("global") : res->second);
  return key;
}

std::string PermissionRequest::to_json() const {
  std::ostringstream out;
  out << "{\"id\":" << common::json_quote(id)
      << ",\"permission_type\":" << common::json_quote(std::string(to_string(permission_type)))
      << ",\"message\":" << common::json_quote(message)
      << ",\"metadata\":" << common::json_object_from_map(metadata) << "}";
  return out.str();
}

std::string_view to_string(PermissionResponse response) {
  switch (response) {
  case PermissionResponse::Allow:
    return "allow";
  case PermissionResponse::Deny:
    return "deny";
  case PermissionResponse::AllowAlways:
    return "allow_always";
  }
  return "deny";
}

common::Result<PermissionResponse> permission_response_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "allow") {
    return common::Result<PermissionResponse>::success(PermissionResponse::Allow);
  }
  if (normalized == "deny") {
    return common::Result<PermissionResponse>::success(PermissionResponse::Deny);
  }
  if (normalized == "allow_always") {
    return common::Result<PermissionResponse>::success(PermissionResponse::AllowAlways);
  }
  return common::Result<PermissionResponse>::failure("unknown permission response: " + value);
}

bool is_allowed(PermissionResponse response) {
  return response == PermissionResponse::Allow || response == PermissionResponse::AllowAlways;
}

bool should_cache(PermissionResponse response) {
  return response == PermissionResponse::AllowAlways;
}

} // namespace cowork::permissions

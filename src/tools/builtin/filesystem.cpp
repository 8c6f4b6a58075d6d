#include "cowork/tools/builtin/filesystem.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/common/json_util.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace cowork::tools {

namespace {

enum class Operation { ReadFile, WriteFile, ListDir, MakeDir, DeleteFile };

common::Result<Operation> parse_operation(const std::string &value) {
  if (value == "read_file") {
    return common::Result<Operation>::success(Operation::ReadFile);
  }
  if (value == "write_file") {
    return common::Result<Operation>::success(Operation::WriteFile);
  }
  if (value == "list_dir") {
    return common::Result<Operation>::success(Operation::ListDir);
  }
  if (value == "make_dir") {
    return common::Result<Operation>::success(Operation::MakeDir);
  }
  if (value == "delete_file") {
    return common::Result<Operation>::success(Operation::DeleteFile);
  }
  return common::Result<Operation>::failure("unknown operation '" + value + "'");
}

bool is_read(const Operation op) { return op == Operation::ReadFile || op == Operation::ListDir; }

std::string arg_or_empty(const ToolArgs &args, const std::string &key) {
  const auto it = args.find(key);
  return it == args.end() ? std::string() : it->second;
}

common::Result<std::string> list_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return common::Result<std::string>::failure(ec.message());
  }
  std::vector<std::pair<std::string, bool>> entries;
  for (const auto &entry : it) {
    std::error_code type_ec;
    entries.emplace_back(entry.path().filename().string(), entry.is_directory(type_ec));
  }
  std::sort(entries.begin(), entries.end());

  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < entries.size(); ++i) {
    out << (i == 0 ? "" : ",") << "{\"name\":" << common::json_quote(entries[i].first)
        << ",\"type\":\"" << (entries[i].second ? "directory" : "file") << "\"}";
  }
  out << "]";
  return common::Result<std::string>::success(out.str());
}

} // namespace

std::string_view FilesystemTool::name() const { return "filesystem"; }

std::string_view FilesystemTool::description() const {
  return "Read, write, list files and directories. Path must be relative to workspace root.";
}

std::string FilesystemTool::parameters_schema() const {
  return R"({"type":"object","required":["operation","path"],"properties":{)"
         R"("operation":{"type":"string","enum":["read_file","write_file","list_dir","make_dir","delete_file"]},)"
         R"("path":{"type":"string","description":"Path relative to the workspace"},)"
         R"("content":{"type":"string","description":"Content for write_file"}}})";
}

bool FilesystemTool::requires_approval(const ToolArgs &args) const {
  auto op = parse_operation(arg_or_empty(args, "operation"));
  return op.ok() && !is_read(op.value());
}

bool FilesystemTool::needs_summarization(const ToolArgs &args, const ToolResult &) const {
  return arg_or_empty(args, "operation") == "read_file";
}

common::Result<ToolResult> FilesystemTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  const auto op_it = args.find("operation");
  if (op_it == args.end() || op_it->second.empty()) {
    return common::Result<ToolResult>::success(ToolResult::missing_argument("operation"));
  }
  auto op = parse_operation(op_it->second);
  if (!op.ok()) {
    return common::Result<ToolResult>::success(ToolResult::invalid_argument("operation", op.error()));
  }
  const auto path_it = args.find("path");
  if (path_it == args.end()) {
    return common::Result<ToolResult>::success(ToolResult::missing_argument("path"));
  }
  const std::string &path = path_it->second;

  if (auto valid = validate_relative_path(path); !valid.ok()) {
    return common::Result<ToolResult>::success(
        ToolResult::error(ToolErrorKind::ValidationFailed, valid.error()));
  }
  const std::filesystem::path target = ctx.workspace_path / path;
  if (ctx.scope.is_workspace_scope() && !ctx.scope.is_path_allowed(target)) {
    return common::Result<ToolResult>::success(ToolResult::error(
        ToolErrorKind::ValidationFailed, "Path '" + path + "' is outside the workspace"));
  }

  const std::string verb = is_read(op.value()) ? "read" : "modify";
  const std::string noun = op.value() == Operation::ListDir ? "directory" : "file";
  auto request = permissions::PermissionRequest::create(
      is_read(op.value()) ? permissions::PermissionType::FilesystemRead
                          : permissions::PermissionType::FilesystemWrite,
      "Agent wants to " + verb + " " + noun + " at " + path);
  request.with_resource(path).with_metadata("operation", op_it->second);

  auto allowed = check_permission(ctx, std::move(request));
  if (!allowed.ok()) {
    return common::Result<ToolResult>::success(
        ToolResult::error(ToolErrorKind::PermissionDenied, allowed.error()));
  }
  if (!allowed.value()) {
    return common::Result<ToolResult>::success(
        ToolResult::error(ToolErrorKind::PermissionDenied, "User denied permission"));
  }

  std::error_code ec;
  switch (op.value()) {
  case Operation::ReadFile: {
    auto content = common::read_file(target);
    if (!content.ok()) {
      return common::Result<ToolResult>::success(
          ToolResult::error(ToolErrorKind::ExecutionFailed, content.error()));
    }
    return common::Result<ToolResult>::success(ToolResult::ok(content.value()));
  }
  case Operation::WriteFile: {
    auto written = common::write_file(target, arg_or_empty(args, "content"));
    if (!written.ok()) {
      return common::Result<ToolResult>::success(
          ToolResult::error(ToolErrorKind::ExecutionFailed, written.error()));
    }
    return common::Result<ToolResult>::success(ToolResult::ok("File written successfully"));
  }
  case Operation::ListDir: {
    auto listing = list_directory(target);
    if (!listing.ok()) {
      return common::Result<ToolResult>::success(
          ToolResult::error(ToolErrorKind::ExecutionFailed, listing.error()));
    }
    return common::Result<ToolResult>::success(ToolResult::ok(listing.value()));
  }
  case Operation::MakeDir:
    std::filesystem::create_directories(target, ec);
    if (ec) {
      return common::Result<ToolResult>::success(
          ToolResult::error(ToolErrorKind::ExecutionFailed, ec.message()));
    }
    return common::Result<ToolResult>::success(ToolResult::ok("Directory created"));
  case Operation::DeleteFile:
    if (!std::filesystem::is_regular_file(target, ec)) {
      return common::Result<ToolResult>::success(
          ToolResult::error(ToolErrorKind::ExecutionFailed, "No such file: " + path));
    }
    std::filesystem::remove(target, ec);
    if (ec) {
      return common::Result<ToolResult>::success(
          ToolResult::error(ToolErrorKind::ExecutionFailed, ec.message()));
    }
    return common::Result<ToolResult>::success(ToolResult::ok("File deleted"));
  }
  return common::Result<ToolResult>::success(
      ToolResult::error(ToolErrorKind::Other, "unhandled operation"));
}

} // namespace cowork::tools

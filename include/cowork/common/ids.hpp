#pragma once

#include <string>

namespace cowork::common {

/// Random RFC 4122 version 4 identifier.
[[nodiscard]] std::string new_uuid();

/// Current UTC time as RFC 3339 with second precision, e.g. 2024-05-01T12:00:00Z.
[[nodiscard]] std::string now_rfc3339();

} // namespace cowork::common

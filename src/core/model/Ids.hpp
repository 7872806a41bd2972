#pragma once
#include <string>

namespace vf {

// Random RFC 4122 version-4 UUID, lower-case hex.
std::string uuid4();

// Identifier for this process: <hostname>-<pid>. Valid as a record id.
std::string default_owner_id();

} // namespace vf

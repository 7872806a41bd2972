#pragma once
#include <string>

namespace vf {

// Creates the database if needed, applies pragmas (WAL, busy timeout) and the
// schema file. Idempotent. Throws std::runtime_error on failure.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace vf

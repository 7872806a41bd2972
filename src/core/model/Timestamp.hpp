#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace vf {

// Epoch seconds, UTC. Used for every timestamp in records and the ledger.
using Timestamp = int64_t;

// 2026-10-19T09:30:00Z
std::string format_iso8601(Timestamp t);

// Accepts "Z", "+hh:mm" / "-hh:mm" offsets and fractional seconds
// (fraction is truncated). Returns nullopt on anything else.
std::optional<Timestamp> parse_iso8601(const std::string& s);

// Ledger partition key for a timestamp: YYYY-MM-DD (UTC).
std::string date_key(Timestamp t);

bool is_date_key(const std::string& s);

} // namespace vf

#pragma once
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/model/WorkItem.hpp"

namespace vf {

// Markdown record format:
//
//   ---
//   id: E-1
//   type: email
//   status: intake
//   priority: high
//   created: 2026-10-19T09:30:00Z
//   source: gmail_watcher
//   subject: "Re: invoice"
//   ---
//
//   <body>
//
// Reserved keys map onto WorkItem fields, every other key lands in metadata.
std::string encode_record(const WorkItem& item);

// Throws StoreError(MalformedRecord) when the frontmatter is missing or the
// schema does not validate. When `location` is set it overrides `status`
// (the collection a record sits in is authoritative).
WorkItem decode_record(const std::string& content, std::optional<State> location = std::nullopt);

// Checks the same schema rules decode_record enforces, for records built in
// memory. Throws StoreError(MalformedRecord).
void validate_record(const WorkItem& item);

nlohmann::json to_json(const WorkItem& item);

} // namespace vf

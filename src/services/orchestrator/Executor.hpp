#pragma once
#include <string>
#include <utility>

#include "core/approval/ApprovalGate.hpp"
#include "core/model/WorkItem.hpp"

namespace vf {

// Performs one approved side-effecting action. Implementations for external
// services (mail, social) live with their adapters; throw on failure.
class Executor {
public:
  virtual ~Executor() = default;
  virtual ExecutionOutcome execute(const WorkItem& item) = 0;
};

// Platforms without an automated send path: logs the reply text and where to
// send it, and reports "manual_required".
class ManualExecutor : public Executor {
public:
  explicit ManualExecutor(std::string platform) : platform_(std::move(platform)) {}
  ExecutionOutcome execute(const WorkItem& item) override;

private:
  std::string platform_;
};

// Content of the Markdown section "## <header>" up to the next "## " heading,
// trimmed. Empty when the section is absent.
std::string extract_section(const std::string& body, const std::string& header);

} // namespace vf

#include "traceops/timeline/correlation.hpp"

namespace traceops::timeline {

CorrelationIndex CorrelationIndex::build(const std::vector<transcript::ConversationRecord> &records) {
  CorrelationIndex index;
  for (const auto &record : records) {
    if (record.role != transcript::RecordRole::User) {
      continue;
    }
    for (const auto &block : record.content) {
      if (const auto *result = std::get_if<transcript::ToolResultBlock>(&block);
          result != nullptr) {
        index.results_.insert_or_assign(result->tool_use_id, *result);
      }
    }
  }
  return index;
}

const transcript::ToolResultBlock *CorrelationIndex::find(const std::string &tool_use_id) const {
  const auto it = results_.find(tool_use_id);
  return it == results_.end() ? nullptr : &it->second;
}

} // namespace traceops::timeline

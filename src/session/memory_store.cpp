#include "cohort/session/computation_store.hpp"
#include "cohort/utils/logging.hpp"
#include <algorithm>
#include <mutex>

namespace cohort {

Result<void> InMemoryComputationStore::save(const ComputationSession &session) {
  std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
  sessions_[session.id()] = session;
  COHORT_DEBUG("Stored session " << session.id() << " in memory ("
                                 << sessions_.size() << " total)");
  return Result<void>();
}

Result<ComputationSession>
InMemoryComputationStore::load(const std::string &id) {
  std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return Result<ComputationSession>(ErrorCode::NotFoundError,
                                      "Session not found: " + id);
  }
  return it->second;
}

std::vector<SessionSummary>
InMemoryComputationStore::list(const SessionFilter &filter) {
  std::vector<SessionSummary> summaries;
  {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    for (const auto &[id, session] : sessions_) {
      if (filter.matches(session)) {
        summaries.push_back(summarize(session));
      }
    }
  }

  std::sort(summaries.begin(), summaries.end(),
            [](const SessionSummary &a, const SessionSummary &b) {
              return a.created_at != b.created_at ? a.created_at < b.created_at
                                                  : a.id < b.id;
            });
  return summaries;
}

Result<void> InMemoryComputationStore::remove(const std::string &id) {
  std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
  if (sessions_.erase(id) == 0) {
    return Result<void>(ErrorCode::NotFoundError, "Session not found: " + id);
  }
  return Result<void>();
}

} // namespace cohort

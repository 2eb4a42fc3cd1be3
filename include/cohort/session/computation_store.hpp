#pragma once
#include "cohort/session/computation_session.hpp"
#include "cohort/utils/error_codes.hpp"
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cohort {

// Criteria for list(). Unset fields match everything.
struct SessionFilter {
  std::optional<std::string> org_id; // sessions this organization takes part in
  std::optional<SessionStatus> status;
  std::optional<ComputationType> type;

  bool matches(const ComputationSession &session) const {
    if (org_id && session.participants().count(*org_id) == 0) return false;
    if (status && session.status() != *status) return false;
    if (type && session.type() != *type) return false;
    return true;
  }
};

// Persistence boundary owned by the orchestration layer. The engine never
// assumes a particular storage technology.
class ComputationStore {
public:
  virtual ~ComputationStore() = default;

  // Insert or replace. Once this returns for a COMPUTED session the result
  // must survive a restart of a durable store.
  virtual Result<void> save(const ComputationSession &session) = 0;

  // NotFoundError for unknown ids
  virtual Result<ComputationSession> load(const std::string &id) = 0;

  // Summaries ordered by creation time, oldest first
  virtual std::vector<SessionSummary> list(const SessionFilter &filter) = 0;

  virtual Result<void> remove(const std::string &id) = 0;
};

// Process-local store for tests and single-run jobs
class InMemoryComputationStore : public ComputationStore {
public:
  Result<void> save(const ComputationSession &session) override;
  Result<ComputationSession> load(const std::string &id) override;
  std::vector<SessionSummary> list(const SessionFilter &filter) override;
  Result<void> remove(const std::string &id) override;

private:
  std::unordered_map<std::string, ComputationSession> sessions_;
  std::shared_mutex sessions_mutex_;
};

// One JSON document per session under a directory. Writes go to a temporary
// file that is renamed over the previous version.
class FileComputationStore : public ComputationStore {
public:
  // Creates the directory when missing; throws std::runtime_error if it
  // cannot be created.
  explicit FileComputationStore(std::filesystem::path directory);

  Result<void> save(const ComputationSession &session) override;
  Result<ComputationSession> load(const std::string &id) override;
  std::vector<SessionSummary> list(const SessionFilter &filter) override;
  Result<void> remove(const std::string &id) override;

  const std::filesystem::path &directory() const { return directory_; }

private:
  std::filesystem::path pathFor(const std::string &id) const;
  static bool isSafeId(const std::string &id);

  std::filesystem::path directory_;
  std::shared_mutex files_mutex_;
};

} // namespace cohort

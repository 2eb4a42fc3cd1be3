#pragma once
#include "cohort/mpc/secret_sharing.hpp"
#include "cohort/mpc/secure_aggregator.hpp"
#include "cohort/service/audit_log.hpp"
#include "cohort/service/engine_config.hpp"
#include "cohort/service/result_export.hpp"
#include "cohort/session/computation_store.hpp"
#include "cohort/utils/error_codes.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cohort {

// Progress of one session as reported to the orchestration layer
struct SessionStatusReport {
  std::string session_id;
  ComputationType type = ComputationType::Sum;
  SessionStatus status = SessionStatus::Pending;
  std::size_t threshold = 0;
  std::size_t participants_total = 0;
  std::size_t participants_submitted = 0;
  std::vector<std::string> awaiting_org_ids;
  std::optional<std::string> metric_type;
  std::chrono::time_point<std::chrono::system_clock> created_at;
  std::chrono::time_point<std::chrono::system_clock> updated_at;
  std::optional<std::chrono::time_point<std::chrono::system_clock>>
      completed_at;
};

void to_json(nlohmann::json &j, const SessionStatusReport &report);

// Orchestration-facing facade over sessions, the store and the aggregator.
//
// Every mutating operation runs load-mutate-save under a per-session mutex,
// so concurrent submissions to one session are serialized while different
// sessions proceed independently. Mutexes of unknown or terminal sessions are
// released as soon as their last holder is done.
class ComputationService {
public:
  using Clock = std::chrono::system_clock;

  ComputationService(std::shared_ptr<ComputationStore> store,
                     const EngineConfig &config,
                     std::shared_ptr<AuditLog> audit = nullptr);

  // Returns the new session id. Without a threshold the configured
  // default_threshold is used.
  Result<std::string>
  create(ComputationType type, const std::vector<std::string> &org_ids,
         std::optional<std::size_t> threshold = std::nullopt,
         std::optional<std::string> metric_type = std::nullopt);

  // Validate, split into one share per participant and record
  Result<void> submit(const std::string &session_id, const std::string &org_id,
                      double value);

  Result<ComputationResult> compute(const std::string &session_id);

  Result<ResultLookup> getResult(const std::string &session_id);

  std::vector<SessionSummary>
  list(const std::optional<std::string> &org_id = std::nullopt);
  std::vector<SessionSummary> list(const SessionFilter &filter);

  Result<SessionStatusReport> status(const std::string &session_id);

  Result<void> fail(const std::string &session_id, const std::string &reason,
                    ErrorCode code = ErrorCode::StateError);

  // Fail every non-terminal session created more than session_timeout_seconds
  // before now. Returns the ids that were expired.
  std::vector<std::string> expireStale(Clock::time_point now = Clock::now());

  Result<ExportDocument> exportResult(const std::string &session_id,
                                      const std::string &format);

  // Delete the session record together with any per-session state
  Result<void> remove(const std::string &session_id);

  // Per-session bookkeeping currently held in memory
  std::size_t trackedLockCount() const;
  std::size_t heldInputSessionCount() const;

  const EngineConfig &config() const { return config_; }

private:
  std::shared_ptr<std::mutex> sessionLock(const std::string &session_id);
  // Erase the session's mutex once the caller is its only holder
  void releaseSessionLock(const std::string &session_id,
                          const std::shared_ptr<std::mutex> &held);
  // Drop inputs and idle mutexes of sessions outside open
  void pruneClosedSessions(const std::set<std::string> &open);
  std::string generateSessionId() const;

  // Round-2 party step for variance sessions, backed by local_inputs_
  LocalDeviationStep localStepFor(const std::string &session_id);
  void discardLocalInputs(const std::string &session_id);

  void audit(const std::string &action, const std::string &session_id,
             const std::string &org_id = "",
             nlohmann::json details = nlohmann::json::object());

  std::shared_ptr<ComputationStore> store_;
  EngineConfig config_;
  std::shared_ptr<AuditLog> audit_;

  ShamirSecretSharing scheme_;
  SecureAggregator aggregator_;

  // One mutex per session id (read-heavy: looked up on every operation)
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_locks_;
  mutable std::shared_mutex session_locks_mutex_;

  // Raw party inputs of variance sessions, held in memory only until the
  // session reaches a terminal state
  std::unordered_map<std::string, std::unordered_map<std::string, double>>
      local_inputs_;
  mutable std::mutex local_inputs_mutex_;
};

} // namespace cohort

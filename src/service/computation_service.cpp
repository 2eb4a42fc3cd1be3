#include "cohort/service/computation_service.hpp"
#include "cohort/service/metric_validator.hpp"
#include "cohort/utils/logging.hpp"
#include <set>
#include <sodium.h>
#include <stdexcept>

namespace cohort {

namespace {

int64_t toMillis(std::chrono::time_point<std::chrono::system_clock> tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace

void to_json(nlohmann::json &j, const SessionStatusReport &report) {
  j = nlohmann::json{
      {"session_id", report.session_id},
      {"computation_type", computationTypeToString(report.type)},
      {"status", sessionStatusToString(report.status)},
      {"threshold", report.threshold},
      {"participants_total", report.participants_total},
      {"participants_submitted", report.participants_submitted},
      {"awaiting_org_ids", report.awaiting_org_ids},
      {"created_at", toMillis(report.created_at)},
      {"updated_at", toMillis(report.updated_at)}};
  j["metric_type"] = report.metric_type ? nlohmann::json(*report.metric_type)
                                        : nlohmann::json(nullptr);
  j["completed_at"] = report.completed_at
                          ? nlohmann::json(toMillis(*report.completed_at))
                          : nlohmann::json(nullptr);
}

ComputationService::ComputationService(std::shared_ptr<ComputationStore> store,
                                       const EngineConfig &config,
                                       std::shared_ptr<AuditLog> audit)
    : store_(std::move(store)), config_(config), audit_(std::move(audit)),
      aggregator_(scheme_) {
  if (!store_) {
    throw std::invalid_argument("ComputationService requires a store");
  }
  COHORT_LOG("Computation service ready (" << scheme_.securityMethod()
                                           << ", default threshold "
                                           << config_.default_threshold
                                           << ")");
}

Result<std::string>
ComputationService::create(ComputationType type,
                           const std::vector<std::string> &org_ids,
                           std::optional<std::size_t> threshold,
                           std::optional<std::string> metric_type) {
  std::size_t t =
      threshold.value_or(static_cast<std::size_t>(config_.default_threshold));

  if (metric_type && !MetricValidator::isKnownMetric(*metric_type)) {
    return Result<std::string>(ErrorCode::ValidationError,
                               "Unsupported metric type: " + *metric_type);
  }

  std::string session_id = generateSessionId();
  auto created = ComputationSession::create(session_id, type, org_ids, t,
                                            scheme_.securityMethod(),
                                            metric_type);
  if (!created) {
    return Result<std::string>(created.error(), created.message());
  }

  auto participants = created.value().participants().size();
  if (participants < static_cast<std::size_t>(config_.min_participants)) {
    return Result<std::string>(
        ErrorCode::ValidationError,
        "At least " + std::to_string(config_.min_participants) +
            " participating organizations are required");
  }
  if (participants > static_cast<std::size_t>(config_.max_participants)) {
    return Result<std::string>(
        ErrorCode::ValidationError,
        "At most " + std::to_string(config_.max_participants) +
            " participating organizations are allowed");
  }

  auto saved = store_->save(created.value());
  if (!saved) {
    return Result<std::string>(saved.error(), saved.message());
  }

  COHORT_INFO("Created " << computationTypeToString(type) << " session "
                         << session_id << " with " << participants
                         << " participants, threshold " << t);
  audit(audit_action::kSessionCreated, session_id, "",
        {{"computation_type", computationTypeToString(type)},
         {"threshold", t},
         {"participants", participants},
         {"metric_type", metric_type ? nlohmann::json(*metric_type)
                                     : nlohmann::json(nullptr)}});
  return session_id;
}

Result<void> ComputationService::submit(const std::string &session_id,
                                        const std::string &org_id,
                                        double value) {
  auto lock_ptr = sessionLock(session_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  auto loaded = store_->load(session_id);
  if (!loaded) {
    releaseSessionLock(session_id, lock_ptr);
    return Result<void>(loaded.error(), loaded.message());
  }
  ComputationSession session = loaded.moveValue();

  // Roster and state are checked before the value is looked at
  auto accepted = session.acceptsSubmissionFrom(org_id);
  if (!accepted) {
    COHORT_DEBUG("Rejected submission from " << org_id << " to " << session_id
                                             << ": " << accepted.message());
    if (session.isTerminal()) {
      releaseSessionLock(session_id, lock_ptr);
    }
    return accepted;
  }

  auto validated = MetricValidator::validate(session.metricType(), value);
  if (!validated) {
    return Result<void>(validated.error(), validated.message());
  }

  auto shares = scheme_.generateShares(validated.value(),
                                       session.participants().size(),
                                       session.threshold());
  if (!shares) {
    return Result<void>(shares.error(), shares.message());
  }

  auto submitted = session.submitShare(org_id, shares.moveValue());
  if (!submitted) {
    COHORT_DEBUG("Rejected submission from " << org_id << " to " << session_id
                                             << ": " << submitted.message());
    return submitted;
  }

  auto saved = store_->save(session);
  if (!saved) {
    return saved;
  }

  if (session.type() == ComputationType::Variance) {
    std::lock_guard<std::mutex> inputs_lock(local_inputs_mutex_);
    local_inputs_[session_id][org_id] = validated.value();
  }

  audit(audit_action::kShareSubmitted, session_id, org_id,
        {{"status", sessionStatusToString(session.status())},
         {"submitted", session.submittedCount()}});
  return Result<void>();
}

Result<ComputationResult>
ComputationService::compute(const std::string &session_id) {
  auto lock_ptr = sessionLock(session_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  auto loaded = store_->load(session_id);
  if (!loaded) {
    releaseSessionLock(session_id, lock_ptr);
    return Result<ComputationResult>(loaded.error(), loaded.message());
  }
  ComputationSession session = loaded.moveValue();
  bool was_terminal = session.isTerminal();

  auto result = session.compute(aggregator_, localStepFor(session_id));
  if (was_terminal) {
    // Cached result or recorded error, nothing changed
    releaseSessionLock(session_id, lock_ptr);
    return result;
  }

  auto saved = store_->save(session);
  discardLocalInputs(session_id);
  releaseSessionLock(session_id, lock_ptr);
  if (!saved) {
    COHORT_ERROR("Failed to persist computed session " << session_id);
    return Result<ComputationResult>(saved.error(), saved.message());
  }

  if (result) {
    COHORT_LOG("Session " << session_id << " computed "
                          << computationTypeToString(session.type()) << " over "
                          << result.value().participantCount()
                          << " participants");
    audit(audit_action::kComputationExecuted, session_id, "",
          {{"computation_type", computationTypeToString(session.type())},
           {"participant_count", result.value().participantCount()},
           {"security_method", result.value().security_method}});
  } else {
    COHORT_LOG("Session " << session_id << " failed: "
                          << errorToString(result.error()));
    audit(audit_action::kComputationFailed, session_id, "",
          {{"error", std::string(errorToString(result.error()))},
           {"message", std::string(result.message())}});
  }
  return result;
}

Result<ResultLookup>
ComputationService::getResult(const std::string &session_id) {
  auto loaded = store_->load(session_id);
  if (!loaded) {
    return Result<ResultLookup>(loaded.error(), loaded.message());
  }
  return loaded.value().getResult();
}

std::vector<SessionSummary>
ComputationService::list(const std::optional<std::string> &org_id) {
  SessionFilter filter;
  filter.org_id = org_id;
  return store_->list(filter);
}

std::vector<SessionSummary>
ComputationService::list(const SessionFilter &filter) {
  return store_->list(filter);
}

Result<SessionStatusReport>
ComputationService::status(const std::string &session_id) {
  auto loaded = store_->load(session_id);
  if (!loaded) {
    return Result<SessionStatusReport>(loaded.error(), loaded.message());
  }
  const ComputationSession &session = loaded.value();

  SessionStatusReport report;
  report.session_id = session.id();
  report.type = session.type();
  report.status = session.status();
  report.threshold = session.threshold();
  report.participants_total = session.participants().size();
  report.participants_submitted = session.submittedCount();
  for (const auto &org_id : session.participants()) {
    if (!session.hasSubmitted(org_id)) {
      report.awaiting_org_ids.push_back(org_id);
    }
  }
  report.metric_type = session.metricType();
  report.created_at = session.createdAt();
  report.updated_at = session.updatedAt();
  report.completed_at = session.completedAt();

  audit(audit_action::kStatusChecked, session_id, "",
        {{"status", sessionStatusToString(report.status)}});
  return report;
}

Result<void> ComputationService::fail(const std::string &session_id,
                                      const std::string &reason,
                                      ErrorCode code) {
  auto lock_ptr = sessionLock(session_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  auto loaded = store_->load(session_id);
  if (!loaded) {
    releaseSessionLock(session_id, lock_ptr);
    return Result<void>(loaded.error(), loaded.message());
  }
  ComputationSession session = loaded.moveValue();

  auto failed = session.fail(code, reason);
  if (!failed) {
    releaseSessionLock(session_id, lock_ptr);
    return failed;
  }

  auto saved = store_->save(session);
  discardLocalInputs(session_id);
  releaseSessionLock(session_id, lock_ptr);
  if (!saved) {
    return saved;
  }

  audit(audit_action::kComputationFailed, session_id, "",
        {{"error", std::string(errorToString(code))}, {"message", reason}});
  return Result<void>();
}

std::vector<std::string>
ComputationService::expireStale(Clock::time_point now) {
  const auto timeout = std::chrono::seconds(config_.session_timeout_seconds);
  const std::string elapsed =
      std::to_string(config_.session_timeout_seconds) + " seconds";

  std::vector<std::string> expired;
  std::set<std::string> open;
  for (const auto &summary : store_->list(SessionFilter{})) {
    if (summary.status == SessionStatus::Computed ||
        summary.status == SessionStatus::Failed) {
      continue;
    }
    if (now - summary.created_at <= timeout) {
      open.insert(summary.id);
      continue;
    }

    // A READY session had its quorum, it was only never computed
    const bool reached_quorum = summary.status == SessionStatus::Ready;
    auto failed =
        reached_quorum
            ? fail(summary.id,
                   "Session timed out after " + elapsed +
                       ": quorum was reached but the result was never computed",
                   ErrorCode::StateError)
            : fail(summary.id,
                   "Session timed out after " + elapsed +
                       " without reaching its threshold of submissions",
                   ErrorCode::InsufficientShares);
    if (failed) {
      expired.push_back(summary.id);
    } else if (failed.error() != ErrorCode::StateError) {
      // StateError means it completed concurrently
      COHORT_WARN("Could not expire session " << summary.id << ": "
                                              << failed.message());
    }
  }

  pruneClosedSessions(open);

  if (!expired.empty()) {
    COHORT_LOG("Expired " << expired.size() << " stale session(s)");
  }
  return expired;
}

Result<void> ComputationService::remove(const std::string &session_id) {
  auto lock_ptr = sessionLock(session_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  auto removed = store_->remove(session_id);
  discardLocalInputs(session_id);
  releaseSessionLock(session_id, lock_ptr);
  if (!removed) {
    return removed;
  }

  audit(audit_action::kSessionRemoved, session_id);
  return Result<void>();
}

Result<ExportDocument>
ComputationService::exportResult(const std::string &session_id,
                                 const std::string &format) {
  auto loaded = store_->load(session_id);
  if (!loaded) {
    return Result<ExportDocument>(loaded.error(), loaded.message());
  }
  return ResultExporter::exportSession(loaded.value(), format);
}

std::shared_ptr<std::mutex>
ComputationService::sessionLock(const std::string &session_id) {
  {
    std::shared_lock<std::shared_mutex> read_lock(session_locks_mutex_);
    auto it = session_locks_.find(session_id);
    if (it != session_locks_.end()) {
      return it->second;
    }
  }

  std::unique_lock<std::shared_mutex> write_lock(session_locks_mutex_);
  auto &slot = session_locks_[session_id];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

void ComputationService::releaseSessionLock(
    const std::string &session_id, const std::shared_ptr<std::mutex> &held) {
  std::unique_lock<std::shared_mutex> write_lock(session_locks_mutex_);
  auto it = session_locks_.find(session_id);
  // Copies are only taken under this mutex, so the count is exact here:
  // the map plus the caller means nobody else is queued on it
  if (it != session_locks_.end() && it->second == held &&
      held.use_count() == 2) {
    session_locks_.erase(it);
  }
}

void ComputationService::pruneClosedSessions(
    const std::set<std::string> &open) {
  std::vector<std::string> candidates;
  {
    std::lock_guard<std::mutex> inputs_lock(local_inputs_mutex_);
    for (const auto &[session_id, inputs] : local_inputs_) {
      if (open.count(session_id) == 0) {
        candidates.push_back(session_id);
      }
    }
  }

  // Re-check under the session mutex: the session may have been created
  // after the listing and be taking submissions right now
  for (const auto &session_id : candidates) {
    auto lock_ptr = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);
    auto loaded = store_->load(session_id);
    bool closed = loaded ? loaded.value().isTerminal()
                         : loaded.error() == ErrorCode::NotFoundError;
    if (closed) {
      COHORT_DEBUG("Dropping local inputs of closed session " << session_id);
      discardLocalInputs(session_id);
    }
    releaseSessionLock(session_id, lock_ptr);
  }

  // A mutex nobody holds can always be recreated on demand
  std::unique_lock<std::shared_mutex> write_lock(session_locks_mutex_);
  for (auto it = session_locks_.begin(); it != session_locks_.end();) {
    if (it->second.use_count() == 1) {
      it = session_locks_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t ComputationService::trackedLockCount() const {
  std::shared_lock<std::shared_mutex> read_lock(session_locks_mutex_);
  return session_locks_.size();
}

std::size_t ComputationService::heldInputSessionCount() const {
  std::lock_guard<std::mutex> inputs_lock(local_inputs_mutex_);
  return local_inputs_.size();
}

std::string ComputationService::generateSessionId() const {
  unsigned char bytes[16];
  randombytes_buf(bytes, sizeof(bytes));

  char hex[sizeof(bytes) * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), bytes, sizeof(bytes));
  return std::string(hex);
}

LocalDeviationStep
ComputationService::localStepFor(const std::string &session_id) {
  return [this, session_id](const std::string &party_id,
                            double mean) -> Result<double> {
    std::lock_guard<std::mutex> inputs_lock(local_inputs_mutex_);
    auto session_it = local_inputs_.find(session_id);
    if (session_it == local_inputs_.end()) {
      return Result<double>(ErrorCode::NotFoundError,
                            "No local inputs held for session " + session_id);
    }
    auto party_it = session_it->second.find(party_id);
    if (party_it == session_it->second.end()) {
      return Result<double>(ErrorCode::NotFoundError,
                            "No local input held for " + party_id);
    }
    double deviation = party_it->second - mean;
    return deviation * deviation;
  };
}

void ComputationService::discardLocalInputs(const std::string &session_id) {
  std::lock_guard<std::mutex> inputs_lock(local_inputs_mutex_);
  local_inputs_.erase(session_id);
}

void ComputationService::audit(const std::string &action,
                               const std::string &session_id,
                               const std::string &org_id,
                               nlohmann::json details) {
  if (audit_) {
    audit_->record(action, session_id, org_id, std::move(details));
  }
}

} // namespace cohort

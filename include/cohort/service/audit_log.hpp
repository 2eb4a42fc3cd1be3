#pragma once
#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cohort {

// Audited operations
namespace audit_action {
constexpr const char *kSessionCreated = "session_created";
constexpr const char *kShareSubmitted = "share_submitted";
constexpr const char *kComputationExecuted = "computation_executed";
constexpr const char *kComputationFailed = "computation_failed";
constexpr const char *kStatusChecked = "status_checked";
constexpr const char *kSessionRemoved = "session_removed";
} // namespace audit_action

struct AuditEntry {
  uint64_t sequence = 0;
  std::chrono::time_point<std::chrono::system_clock> timestamp;
  std::string action;
  std::string session_id;
  std::string org_id; // empty for orchestrator-driven actions
  nlohmann::json details = nlohmann::json::object();
  std::string signature; // Ed25519 over signedPayload()

  // Canonical byte string covered by the signature
  std::string signedPayload() const;
};

inline void to_json(nlohmann::json &j, const AuditEntry &e) {
  j = nlohmann::json{
      {"sequence", e.sequence},
      {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                        e.timestamp.time_since_epoch())
                        .count()},
      {"action", e.action},
      {"session_id", e.session_id},
      {"org_id", e.org_id},
      {"details", e.details},
      {"signature", e.signature}};
}

inline void from_json(const nlohmann::json &j, AuditEntry &e) {
  j.at("sequence").get_to(e.sequence);
  int64_t timestamp_ms = j.at("timestamp");
  e.timestamp = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(timestamp_ms));
  j.at("action").get_to(e.action);
  j.at("session_id").get_to(e.session_id);
  j.at("org_id").get_to(e.org_id);
  e.details = j.at("details");
  j.at("signature").get_to(e.signature);
}

// Append-only, signed record of session operations. Callers must never put
// submitted values or shares into details.
class AuditLog {
public:
  // Entries are kept in memory and, when path is non-empty, appended to it as
  // JSON lines. Throws std::runtime_error if the file cannot be opened.
  explicit AuditLog(const std::string &path = "");

  AuditEntry record(const std::string &action, const std::string &session_id,
                    const std::string &org_id = "",
                    nlohmann::json details = nlohmann::json::object());

  std::vector<AuditEntry> entries() const;
  std::vector<AuditEntry> entriesFor(const std::string &session_id) const;

  const std::string &publicKey() const { return public_key_; }

  bool verify(const AuditEntry &entry) const;

private:
  std::string public_key_;
  std::string private_key_;

  mutable std::mutex entries_mutex_;
  std::vector<AuditEntry> entries_;
  uint64_t next_sequence_ = 1;
  std::ofstream sink_;
};

} // namespace cohort

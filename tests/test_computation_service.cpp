#include <gtest/gtest.h>
#include "cohort/service/computation_service.hpp"
#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace cohort;
namespace fs = std::filesystem;

namespace {

// Config file that does not exist, so every default applies
EngineConfig defaultConfig() {
  return EngineConfig("/nonexistent/cohort-test.json");
}

std::vector<std::string> orgs(std::size_t count) {
  std::vector<std::string> ids;
  for (std::size_t i = 0; i < count; ++i) {
    ids.push_back("org-" + std::to_string(i));
  }
  return ids;
}

} // namespace

class ComputationServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_shared<InMemoryComputationStore>();
    audit_ = std::make_shared<AuditLog>();
    service_ = std::make_unique<ComputationService>(store_, defaultConfig(),
                                                    audit_);
  }

  std::string createSession(ComputationType type,
                            const std::vector<std::string> &org_ids,
                            std::size_t threshold,
                            std::optional<std::string> metric = std::nullopt) {
    auto created = service_->create(type, org_ids, threshold, metric);
    EXPECT_TRUE(created) << created.message();
    return created.value();
  }

  std::shared_ptr<InMemoryComputationStore> store_;
  std::shared_ptr<AuditLog> audit_;
  std::unique_ptr<ComputationService> service_;
};

// ============================================================================
// Session creation
// ============================================================================

TEST_F(ComputationServiceTest, CreateReturnsRandomHexIds) {
  auto first = createSession(ComputationType::Sum, {"a", "b"}, 2);
  auto second = createSession(ComputationType::Sum, {"a", "b"}, 2);

  EXPECT_EQ(first.size(), 32u);
  EXPECT_NE(first, second);
  EXPECT_EQ(first.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(ComputationServiceTest, CreateValidatesRequest) {
  EXPECT_EQ(service_->create(ComputationType::Sum, {"a", "b"}, 3).error(),
            ErrorCode::ValidationError);
  EXPECT_EQ(service_->create(ComputationType::Sum, {"a", "b"}, 0).error(),
            ErrorCode::ValidationError);
  EXPECT_EQ(service_->create(ComputationType::Sum, {"a", "a"}, 1).error(),
            ErrorCode::ValidationError);
  // min_participants defaults to 2
  EXPECT_EQ(service_->create(ComputationType::Sum, {"a"}, 1).error(),
            ErrorCode::ValidationError);
  EXPECT_EQ(service_
                ->create(ComputationType::Sum, {"a", "b"}, 2,
                         std::string("cholesterol"))
                .error(),
            ErrorCode::ValidationError);
  EXPECT_TRUE(service_->list().empty());
}

TEST_F(ComputationServiceTest, CreateUsesConfiguredDefaultThreshold) {
  auto id = createSession(ComputationType::Sum, {"a", "b", "c"}, 2);
  auto created = service_->create(ComputationType::Sum, {"a", "b", "c"});
  ASSERT_TRUE(created);

  auto report = service_->status(created.value());
  ASSERT_TRUE(report);
  EXPECT_EQ(report.value().threshold, 2u);
  EXPECT_NE(id, created.value());
}

// ============================================================================
// End-to-end computations
// ============================================================================

TEST_F(ComputationServiceTest, SumEndToEnd) {
  auto id = createSession(ComputationType::Sum, {"a", "b", "c"}, 2);
  ASSERT_TRUE(service_->submit(id, "a", 10.5));
  ASSERT_TRUE(service_->submit(id, "b", 20.75));
  ASSERT_TRUE(service_->submit(id, "c", 30.25));

  auto result = service_->compute(id);
  ASSERT_TRUE(result) << result.message();
  EXPECT_NEAR(result.value().value(), 61.5, 1e-4);
  EXPECT_EQ(result.value().security_method, "shamir-threshold-v1");

  auto lookup = service_->getResult(id);
  ASSERT_TRUE(lookup);
  ASSERT_TRUE(lookup.value().result.has_value());
  EXPECT_NEAR(lookup.value().result->value(), 61.5, 1e-4);
}

TEST_F(ComputationServiceTest, MeanEndToEnd) {
  auto id = createSession(ComputationType::Mean, {"a", "b", "c"}, 3);
  ASSERT_TRUE(service_->submit(id, "a", 10.5));
  ASSERT_TRUE(service_->submit(id, "b", 20.75));
  ASSERT_TRUE(service_->submit(id, "c", 30.25));

  auto result = service_->compute(id);
  ASSERT_TRUE(result) << result.message();
  EXPECT_NEAR(result.value().value(), 20.5, 1e-4);
}

TEST_F(ComputationServiceTest, VarianceEndToEnd) {
  auto id = createSession(ComputationType::Variance, {"a", "b", "c"}, 2);
  ASSERT_TRUE(service_->submit(id, "a", 10.5));
  ASSERT_TRUE(service_->submit(id, "b", 20.75));
  ASSERT_TRUE(service_->submit(id, "c", 30.25));

  auto result = service_->compute(id);
  ASSERT_TRUE(result) << result.message();
  EXPECT_NEAR(result.value().value(), 65.0416667, 1e-4);

  const auto *variance = std::get_if<VarianceResult>(&result.value().statistic);
  ASSERT_NE(variance, nullptr);
  EXPECT_NEAR(variance->mean, 20.5, 1e-4);
}

TEST_F(ComputationServiceTest, VarianceOfLargeCounts) {
  // Platelet counts: squared deviations of 2.25e10 per party
  auto id = createSession(ComputationType::Variance, {"a", "b", "c"}, 2);
  ASSERT_TRUE(service_->submit(id, "a", 150000.0));
  ASSERT_TRUE(service_->submit(id, "b", 450000.0));
  ASSERT_TRUE(service_->submit(id, "c", 300000.0));

  auto result = service_->compute(id);
  ASSERT_TRUE(result) << result.message();
  EXPECT_NEAR(result.value().value(), 1.5e10, 1e-2);
}

TEST_F(ComputationServiceTest, VarianceNeedsInputsHeldByThisProcess) {
  auto id = createSession(ComputationType::Variance, {"a", "b"}, 2);
  ASSERT_TRUE(service_->submit(id, "a", 1.0));
  ASSERT_TRUE(service_->submit(id, "b", 3.0));

  // A second service over the same store never saw the raw inputs
  ComputationService restarted(store_, defaultConfig());
  auto result = restarted.compute(id);
  EXPECT_EQ(result.error(), ErrorCode::DimensionMismatch);

  auto lookup = service_->getResult(id);
  ASSERT_TRUE(lookup);
  EXPECT_EQ(lookup.value().status, SessionStatus::Failed);
}

TEST_F(ComputationServiceTest, ComputeIsIdempotent) {
  auto id = createSession(ComputationType::Sum, {"a", "b"}, 2);
  ASSERT_TRUE(service_->submit(id, "a", 1.0));
  ASSERT_TRUE(service_->submit(id, "b", 2.0));

  auto first = service_->compute(id);
  auto second = service_->compute(id);
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(first.value().computed_at, second.value().computed_at);

  std::size_t executed = 0;
  for (const auto &entry : audit_->entriesFor(id)) {
    if (entry.action == audit_action::kComputationExecuted) ++executed;
  }
  EXPECT_EQ(executed, 1u);
}

TEST_F(ComputationServiceTest, ComputeBelowThresholdFailsSession) {
  auto id = createSession(ComputationType::Sum, {"a", "b", "c"}, 3);
  ASSERT_TRUE(service_->submit(id, "a", 1.0));

  EXPECT_EQ(service_->compute(id).error(), ErrorCode::InsufficientShares);

  auto lookup = service_->getResult(id);
  ASSERT_TRUE(lookup);
  EXPECT_EQ(lookup.value().status, SessionStatus::Failed);
  ASSERT_TRUE(lookup.value().error.has_value());
  EXPECT_EQ(lookup.value().error->code, ErrorCode::InsufficientShares);

  EXPECT_EQ(service_->submit(id, "b", 2.0).error(), ErrorCode::StateError);
}

TEST_F(ComputationServiceTest, PendingResultBeforeCompute) {
  auto id = createSession(ComputationType::Sum, {"a", "b"}, 2);
  auto lookup = service_->getResult(id);
  ASSERT_TRUE(lookup);
  EXPECT_TRUE(lookup.value().isPending());
  EXPECT_EQ(lookup.value().status, SessionStatus::Pending);
}

TEST_F(ComputationServiceTest, UnknownSessionIsNotFound) {
  EXPECT_EQ(service_->submit("nope", "a", 1.0).error(),
            ErrorCode::NotFoundError);
  EXPECT_EQ(service_->compute("nope").error(), ErrorCode::NotFoundError);
  EXPECT_EQ(service_->getResult("nope").error(), ErrorCode::NotFoundError);
  EXPECT_EQ(service_->status("nope").error(), ErrorCode::NotFoundError);
  EXPECT_EQ(service_->fail("nope", "x").error(), ErrorCode::NotFoundError);
  EXPECT_EQ(service_->exportResult("nope", "json").error(),
            ErrorCode::NotFoundError);
}

// ============================================================================
// Submission validation
// ============================================================================

TEST_F(ComputationServiceTest, MetricValuesAreRangeChecked) {
  auto id = createSession(ComputationType::Mean, {"a", "b"}, 2,
                          std::string("heart_rate"));
  EXPECT_EQ(service_->submit(id, "a", 300.0).error(),
            ErrorCode::ValidationError);
  EXPECT_EQ(service_->submit(id, "a", 10.0).error(),
            ErrorCode::ValidationError);
  ASSERT_TRUE(service_->submit(id, "a", 72.0));
  ASSERT_TRUE(service_->submit(id, "b", 88.0));

  auto result = service_->compute(id);
  ASSERT_TRUE(result);
  EXPECT_NEAR(result.value().value(), 80.0, 1e-4);
}

TEST_F(ComputationServiceTest, RejectedSubmissionsDoNotCount) {
  auto id = createSession(ComputationType::Sum, {"a", "b"}, 2);
  EXPECT_EQ(service_->submit(id, "outsider", 1.0).error(),
            ErrorCode::NotFoundError);
  EXPECT_EQ(service_->submit(id, "a", std::nan("")).error(),
            ErrorCode::ValidationError);
  EXPECT_EQ(service_->submit(id, "a", 1.0e12).error(),
            ErrorCode::PrecisionLossError);
  ASSERT_TRUE(service_->submit(id, "a", 1.0));
  EXPECT_EQ(service_->submit(id, "a", 2.0).error(), ErrorCode::StateError);

  auto report = service_->status(id);
  ASSERT_TRUE(report);
  EXPECT_EQ(report.value().participants_submitted, 1u);
  EXPECT_EQ(report.value().status, SessionStatus::Collecting);
  EXPECT_EQ(report.value().awaiting_org_ids, std::vector<std::string>{"b"});
}

TEST_F(ComputationServiceTest, ClosedSessionsReportStateBeforeValue) {
  auto id = createSession(ComputationType::Mean, {"a", "b", "c"}, 2,
                          std::string("heart_rate"));
  ASSERT_TRUE(service_->submit(id, "a", 72.0));
  ASSERT_TRUE(service_->submit(id, "b", 88.0));

  // Duplicate submissions are refused whatever the value
  EXPECT_EQ(service_->submit(id, "a", std::nan("")).error(),
            ErrorCode::StateError);
  EXPECT_EQ(service_->submit(id, "outsider", 999.0).error(),
            ErrorCode::NotFoundError);

  ASSERT_TRUE(service_->compute(id));
  EXPECT_EQ(service_->submit(id, "c", std::nan("")).error(),
            ErrorCode::StateError);
  EXPECT_EQ(service_->submit(id, "c", 500.0).error(), ErrorCode::StateError);
  EXPECT_EQ(service_->submit(id, "c", 80.0).error(), ErrorCode::StateError);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(ComputationServiceTest, ConcurrentSubmitsRecordEachOrgOnce) {
  const auto roster = orgs(40);
  auto id = createSession(ComputationType::Sum, roster, 20);

  // Every org submits twice from different threads; exactly one wins
  std::atomic<int> accepted{0};
  std::atomic<int> duplicates{0};
  std::vector<std::thread> threads;
  for (int round = 0; round < 2; ++round) {
    for (const auto &org : roster) {
      threads.emplace_back([&, org]() {
        auto submitted = service_->submit(id, org, 1.5);
        if (submitted) {
          ++accepted;
        } else if (submitted.error() == ErrorCode::StateError) {
          ++duplicates;
        }
      });
    }
  }
  for (auto &t : threads) t.join();

  EXPECT_EQ(accepted.load(), 40);
  EXPECT_EQ(duplicates.load(), 40);

  auto report = service_->status(id);
  ASSERT_TRUE(report);
  EXPECT_EQ(report.value().participants_submitted, 40u);
  EXPECT_EQ(report.value().status, SessionStatus::Ready);

  auto result = service_->compute(id);
  ASSERT_TRUE(result) << result.message();
  EXPECT_NEAR(result.value().value(), 60.0, 1e-4);
}

TEST_F(ComputationServiceTest, ConcurrentComputeTransitionsOnce) {
  auto id = createSession(ComputationType::Mean, {"a", "b", "c"}, 2);
  ASSERT_TRUE(service_->submit(id, "a", 3.0));
  ASSERT_TRUE(service_->submit(id, "b", 5.0));

  std::vector<std::thread> threads;
  std::atomic<int> succeeded{0};
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      if (service_->compute(id)) ++succeeded;
    });
  }
  for (auto &t : threads) t.join();

  EXPECT_EQ(succeeded.load(), 8);
  std::size_t executed = 0;
  for (const auto &entry : audit_->entriesFor(id)) {
    if (entry.action == audit_action::kComputationExecuted) ++executed;
  }
  EXPECT_EQ(executed, 1u);
}

TEST_F(ComputationServiceTest, SessionsAreIndependent) {
  auto sum_id = createSession(ComputationType::Sum, {"a", "b"}, 2);
  auto mean_id = createSession(ComputationType::Mean, {"a", "b"}, 2);

  std::thread first([&]() {
    EXPECT_TRUE(service_->submit(sum_id, "a", 1.0));
    EXPECT_TRUE(service_->submit(sum_id, "b", 2.0));
  });
  std::thread second([&]() {
    EXPECT_TRUE(service_->submit(mean_id, "a", 10.0));
    EXPECT_TRUE(service_->submit(mean_id, "b", 20.0));
  });
  first.join();
  second.join();

  EXPECT_NEAR(service_->compute(sum_id).value().value(), 3.0, 1e-4);
  EXPECT_NEAR(service_->compute(mean_id).value().value(), 15.0, 1e-4);
}

// ============================================================================
// Orchestration
// ============================================================================

TEST_F(ComputationServiceTest, ListFiltersByOrganization) {
  auto ab = createSession(ComputationType::Sum, {"a", "b"}, 2);
  auto bc = createSession(ComputationType::Mean, {"b", "c"}, 2);

  EXPECT_EQ(service_->list().size(), 2u);
  EXPECT_EQ(service_->list(std::string("b")).size(), 2u);

  auto only_c = service_->list(std::string("c"));
  ASSERT_EQ(only_c.size(), 1u);
  EXPECT_EQ(only_c[0].id, bc);
  EXPECT_EQ(only_c[0].type, ComputationType::Mean);

  EXPECT_TRUE(service_->list(std::string("z")).empty());

  SessionFilter pending;
  pending.status = SessionStatus::Pending;
  pending.type = ComputationType::Sum;
  auto filtered = service_->list(pending);
  ASSERT_EQ(filtered.size(), 1u);
  EXPECT_EQ(filtered[0].id, ab);
}

TEST_F(ComputationServiceTest, FailIsTerminal) {
  auto id = createSession(ComputationType::Sum, {"a", "b"}, 2);
  ASSERT_TRUE(service_->fail(id, "cancelled by coordinator"));

  auto lookup = service_->getResult(id);
  ASSERT_TRUE(lookup);
  ASSERT_TRUE(lookup.value().error.has_value());
  EXPECT_EQ(lookup.value().error->message, "cancelled by coordinator");

  EXPECT_EQ(service_->fail(id, "again").error(), ErrorCode::StateError);
  EXPECT_EQ(service_->compute(id).error(), ErrorCode::StateError);
}

TEST_F(ComputationServiceTest, ExpireStaleFailsOnlyOldOpenSessions) {
  auto open = createSession(ComputationType::Sum, {"a", "b"}, 2);
  auto done = createSession(ComputationType::Sum, {"a", "b"}, 1);
  ASSERT_TRUE(service_->submit(done, "a", 4.0));
  ASSERT_TRUE(service_->compute(done));

  // Nothing is older than the timeout yet
  EXPECT_TRUE(service_->expireStale().empty());

  auto later = std::chrono::system_clock::now() +
               std::chrono::seconds(service_->config().session_timeout_seconds + 1);
  auto expired = service_->expireStale(later);
  ASSERT_EQ(expired.size(), 1u);
  EXPECT_EQ(expired[0], open);

  auto lookup = service_->getResult(open);
  ASSERT_TRUE(lookup);
  EXPECT_EQ(lookup.value().status, SessionStatus::Failed);
  EXPECT_EQ(lookup.value().error->code, ErrorCode::InsufficientShares);

  auto computed = service_->getResult(done);
  ASSERT_TRUE(computed);
  EXPECT_EQ(computed.value().status, SessionStatus::Computed);
}

TEST_F(ComputationServiceTest, ExpiredReadySessionsAreNotShortOfShares) {
  auto collecting = createSession(ComputationType::Sum, {"a", "b", "c"}, 2);
  auto ready = createSession(ComputationType::Sum, {"a", "b", "c"}, 2);
  ASSERT_TRUE(service_->submit(collecting, "a", 1.0));
  ASSERT_TRUE(service_->submit(ready, "a", 1.0));
  ASSERT_TRUE(service_->submit(ready, "b", 2.0));

  auto later = std::chrono::system_clock::now() +
               std::chrono::seconds(service_->config().session_timeout_seconds + 1);
  EXPECT_EQ(service_->expireStale(later).size(), 2u);

  auto short_of_shares = service_->getResult(collecting);
  ASSERT_TRUE(short_of_shares);
  ASSERT_TRUE(short_of_shares.value().error.has_value());
  EXPECT_EQ(short_of_shares.value().error->code, ErrorCode::InsufficientShares);

  auto never_computed = service_->getResult(ready);
  ASSERT_TRUE(never_computed);
  ASSERT_TRUE(never_computed.value().error.has_value());
  EXPECT_EQ(never_computed.value().error->code, ErrorCode::StateError);
  EXPECT_NE(never_computed.value().error->message.find("quorum was reached"),
            std::string::npos);
}

// ============================================================================
// Per-session bookkeeping
// ============================================================================

TEST_F(ComputationServiceTest, UnknownIdsLeaveNoMutexBehind) {
  for (int i = 0; i < 50; ++i) {
    const std::string bogus = "unknown-" + std::to_string(i);
    EXPECT_EQ(service_->submit(bogus, "a", 1.0).error(),
              ErrorCode::NotFoundError);
    EXPECT_EQ(service_->compute(bogus).error(), ErrorCode::NotFoundError);
    EXPECT_EQ(service_->fail(bogus, "x").error(), ErrorCode::NotFoundError);
  }
  EXPECT_EQ(service_->trackedLockCount(), 0u);
}

TEST_F(ComputationServiceTest, TerminalSessionsReleaseTheirState) {
  std::vector<std::string> ids;
  for (int i = 0; i < 10; ++i) {
    auto id = createSession(ComputationType::Variance, {"a", "b"}, 2);
    ASSERT_TRUE(service_->submit(id, "a", 1.0 + i));
    ASSERT_TRUE(service_->submit(id, "b", 5.0 + i));
    ids.push_back(id);
  }
  EXPECT_EQ(service_->heldInputSessionCount(), 10u);
  EXPECT_EQ(service_->trackedLockCount(), 10u);

  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i % 2 == 0) {
      ASSERT_TRUE(service_->compute(ids[i]));
    } else {
      ASSERT_TRUE(service_->fail(ids[i], "cancelled"));
    }
  }
  EXPECT_EQ(service_->heldInputSessionCount(), 0u);
  EXPECT_EQ(service_->trackedLockCount(), 0u);

  // Reads and rejected writes on closed sessions do not bring them back
  EXPECT_TRUE(service_->compute(ids[0]));
  EXPECT_EQ(service_->submit(ids[1], "a", 1.0).error(), ErrorCode::StateError);
  EXPECT_EQ(service_->trackedLockCount(), 0u);
}

TEST_F(ComputationServiceTest, RemovedSessionsReleaseTheirState) {
  auto removed = createSession(ComputationType::Variance, {"a", "b"}, 2);
  auto dropped = createSession(ComputationType::Variance, {"a", "b"}, 2);
  auto open = createSession(ComputationType::Variance, {"a", "b"}, 2);
  ASSERT_TRUE(service_->submit(removed, "a", 1.0));
  ASSERT_TRUE(service_->submit(dropped, "a", 2.0));
  ASSERT_TRUE(service_->submit(open, "a", 3.0));
  EXPECT_EQ(service_->heldInputSessionCount(), 3u);

  ASSERT_TRUE(service_->remove(removed));
  EXPECT_EQ(service_->getResult(removed).error(), ErrorCode::NotFoundError);
  EXPECT_EQ(service_->remove(removed).error(), ErrorCode::NotFoundError);
  EXPECT_EQ(service_->heldInputSessionCount(), 2u);

  // Removed behind the service's back: the next sweep notices
  ASSERT_TRUE(store_->remove(dropped));
  EXPECT_TRUE(service_->expireStale().empty());
  EXPECT_EQ(service_->heldInputSessionCount(), 1u);
  EXPECT_EQ(service_->trackedLockCount(), 0u);

  // The open session keeps its inputs and still computes
  ASSERT_TRUE(service_->submit(open, "b", 5.0));
  auto result = service_->compute(open);
  ASSERT_TRUE(result) << result.message();
  EXPECT_NEAR(result.value().value(), 1.0, 1e-4);

  auto removals = audit_->entriesFor(removed);
  ASSERT_FALSE(removals.empty());
  EXPECT_EQ(removals.back().action, audit_action::kSessionRemoved);
}

TEST_F(ComputationServiceTest, StatusReportsProgress) {
  auto id = createSession(ComputationType::Sum, {"a", "b", "c"}, 2,
                          std::string("blood_glucose"));
  ASSERT_TRUE(service_->submit(id, "b", 110.0));

  auto report = service_->status(id);
  ASSERT_TRUE(report);
  EXPECT_EQ(report.value().session_id, id);
  EXPECT_EQ(report.value().participants_total, 3u);
  EXPECT_EQ(report.value().participants_submitted, 1u);
  EXPECT_EQ(report.value().awaiting_org_ids,
            (std::vector<std::string>{"a", "c"}));
  EXPECT_EQ(report.value().metric_type,
            std::optional<std::string>("blood_glucose"));
  EXPECT_FALSE(report.value().completed_at.has_value());

  nlohmann::json j = report.value();
  EXPECT_EQ(j["status"], "COLLECTING");
  EXPECT_EQ(j["participants_submitted"], 1);
  EXPECT_TRUE(j["completed_at"].is_null());
}

// ============================================================================
// Audit and export
// ============================================================================

TEST_F(ComputationServiceTest, AuditTrailCoversLifecycleWithoutValues) {
  auto id = createSession(ComputationType::Sum, {"a", "b"}, 2);
  ASSERT_TRUE(service_->submit(id, "a", 123.456));
  ASSERT_TRUE(service_->submit(id, "b", 654.321));
  ASSERT_TRUE(service_->status(id));
  ASSERT_TRUE(service_->compute(id));

  auto entries = audit_->entriesFor(id);
  std::vector<std::string> actions;
  for (const auto &entry : entries) {
    actions.push_back(entry.action);
    EXPECT_TRUE(audit_->verify(entry));
    const auto serialized = nlohmann::json(entry).dump();
    EXPECT_EQ(serialized.find("123.456"), std::string::npos);
    EXPECT_EQ(serialized.find("654.321"), std::string::npos);
  }
  EXPECT_EQ(actions, (std::vector<std::string>{
                         audit_action::kSessionCreated,
                         audit_action::kShareSubmitted,
                         audit_action::kShareSubmitted,
                         audit_action::kStatusChecked,
                         audit_action::kComputationExecuted}));
  EXPECT_EQ(entries[1].org_id, "a");
}

TEST_F(ComputationServiceTest, ExportResult) {
  auto id = createSession(ComputationType::Mean, {"a", "b"}, 2);
  ASSERT_TRUE(service_->submit(id, "a", 2.0));
  ASSERT_TRUE(service_->submit(id, "b", 4.0));
  ASSERT_TRUE(service_->compute(id));

  auto json = service_->exportResult(id, "json");
  ASSERT_TRUE(json);
  auto document = nlohmann::json::parse(json.value().content);
  EXPECT_EQ(document["data"]["computation_id"], id);
  EXPECT_DOUBLE_EQ(document["data"]["result"]["value"].get<double>(), 3.0);

  auto csv = service_->exportResult(id, "CSV");
  ASSERT_TRUE(csv);
  EXPECT_EQ(csv.value().format, "csv");

  EXPECT_EQ(service_->exportResult(id, "xml").error(),
            ErrorCode::ValidationError);
}

// ============================================================================
// Durable store
// ============================================================================

TEST(ComputationServiceFileStoreTest, ResultsSurviveRestart) {
  fs::path dir = fs::temp_directory_path() / "cohort_service_restart";
  fs::remove_all(dir);

  std::string id;
  {
    ComputationService service(std::make_shared<FileComputationStore>(dir),
                               defaultConfig());
    auto created = service.create(ComputationType::Sum, {"a", "b", "c"}, 2);
    ASSERT_TRUE(created);
    id = created.value();
    ASSERT_TRUE(service.submit(id, "a", 1.25));
    ASSERT_TRUE(service.submit(id, "c", 2.5));
    ASSERT_TRUE(service.compute(id));
  }

  ComputationService restarted(std::make_shared<FileComputationStore>(dir),
                               defaultConfig());
  auto lookup = restarted.getResult(id);
  ASSERT_TRUE(lookup) << lookup.message();
  ASSERT_TRUE(lookup.value().result.has_value());
  EXPECT_NEAR(lookup.value().result->value(), 3.75, 1e-4);

  fs::remove_all(dir);
}

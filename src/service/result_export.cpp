#include "cohort/service/result_export.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace cohort {

namespace {

std::string isoTime(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_utc{};
  gmtime_r(&t, &tm_utc);
  std::ostringstream out;
  out << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string compactTime(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_utc{};
  gmtime_r(&t, &tm_utc);
  std::ostringstream out;
  out << std::put_time(&tm_utc, "%Y%m%d_%H%M%S");
  return out.str();
}

// RFC 4180 quoting for fields that need it
std::string csvField(const std::string &value) {
  if (value.find_first_of(",\"\n") == std::string::npos) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string formatValue(double value) {
  std::ostringstream out;
  out << std::setprecision(15) << value;
  return out.str();
}

std::string filenameFor(const ComputationSession &session,
                        const std::string &extension) {
  return "computation_" + session.id() + "_" +
         compactTime(std::chrono::system_clock::now()) + "." + extension;
}

} // namespace

Result<ExportDocument>
ResultExporter::exportSession(const ComputationSession &session,
                              const std::string &format) {
  std::string normalized = format;
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (normalized == "json") return asJson(session);
  if (normalized == "csv") return asCsv(session);

  return Result<ExportDocument>(ErrorCode::ValidationError,
                                "Unsupported export format: " + format);
}

ExportDocument ResultExporter::asJson(const ComputationSession &session) {
  nlohmann::json submitted = nlohmann::json::array();
  for (const auto &[org_id, shares] : session.submissions()) {
    submitted.push_back(org_id);
  }

  nlohmann::json data = {
      {"computation_id", session.id()},
      {"computation_type", computationTypeToString(session.type())},
      {"security_method", session.securityMethod()},
      {"threshold", session.threshold()},
      {"status", sessionStatusToString(session.status())},
      {"created_at", isoTime(session.createdAt())},
      {"participants", session.participants()},
      {"submitted_org_ids", submitted}};

  data["metric_type"] = session.metricType()
                            ? nlohmann::json(*session.metricType())
                            : nlohmann::json(nullptr);
  data["completed_at"] = session.completedAt()
                             ? nlohmann::json(isoTime(*session.completedAt()))
                             : nlohmann::json(nullptr);
  data["result"] = session.result() ? nlohmann::json(*session.result())
                                    : nlohmann::json(nullptr);
  if (session.error()) {
    data["error"] = {{"code", std::string(errorToString(session.error()->code))},
                     {"message", session.error()->message}};
  } else {
    data["error"] = nullptr;
  }

  nlohmann::json document = {
      {"metadata",
       {{"exported_at", isoTime(std::chrono::system_clock::now())},
        {"format", "json"},
        {"version", kExportVersion}}},
      {"data", data}};

  return ExportDocument{"json", filenameFor(session, "json"), document.dump(2),
                        "application/json"};
}

ExportDocument ResultExporter::asCsv(const ComputationSession &session) {
  std::ostringstream out;
  auto row = [&out](const std::string &key, const std::string &value) {
    out << csvField(key) << "," << csvField(value) << "\n";
  };

  out << "Secure Computation Export\n";
  row("Exported at", isoTime(std::chrono::system_clock::now()));
  out << "\n";

  out << "Computation Metadata\n";
  row("Computation ID", session.id());
  row("Computation Type", computationTypeToString(session.type()));
  row("Metric Type", session.metricType().value_or(""));
  row("Security Method", session.securityMethod());
  row("Threshold", std::to_string(session.threshold()));
  row("Status", sessionStatusToString(session.status()));
  row("Created At", isoTime(session.createdAt()));
  row("Completed At",
      session.completedAt() ? isoTime(*session.completedAt()) : "");
  out << "\n";

  out << "Participants\n";
  out << "Organization ID,Submitted\n";
  for (const auto &org_id : session.participants()) {
    row(org_id, session.hasSubmitted(org_id) ? "yes" : "no");
  }
  out << "\n";

  out << "Results\n";
  if (const auto &result = session.result()) {
    row("Operation", computationTypeToString(result->type()));
    row("Value", formatValue(result->value()));
    row("Participant Count", std::to_string(result->participantCount()));
    if (const auto *mean = std::get_if<MeanResult>(&result->statistic)) {
      row("Sum", formatValue(mean->sum));
    } else if (const auto *variance =
                   std::get_if<VarianceResult>(&result->statistic)) {
      row("Mean", formatValue(variance->mean));
    }
    row("Security Method", result->security_method);
    row("Computed At", isoTime(result->computed_at));
  } else if (const auto &error = session.error()) {
    row("Error Code", std::string(errorToString(error->code)));
    row("Error Message", error->message);
  } else {
    row("Pending", "yes");
  }

  return ExportDocument{"csv", filenameFor(session, "csv"), out.str(),
                        "text/csv"};
}

} // namespace cohort

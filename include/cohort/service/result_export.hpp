#pragma once
#include "cohort/session/computation_session.hpp"
#include "cohort/utils/error_codes.hpp"
#include <string>

namespace cohort {

struct ExportDocument {
  std::string format;
  std::string filename;
  std::string content;
  std::string content_type;
};

// Renders a session and its outcome for hand-off to the orchestration layer.
// Shares are never exported, only which organizations submitted.
class ResultExporter {
public:
  static constexpr const char *kExportVersion = "1.0";

  // format is "json" or "csv" (case-insensitive); anything else is a
  // ValidationError
  static Result<ExportDocument> exportSession(const ComputationSession &session,
                                              const std::string &format);

private:
  static ExportDocument asJson(const ComputationSession &session);
  static ExportDocument asCsv(const ComputationSession &session);
};

} // namespace cohort

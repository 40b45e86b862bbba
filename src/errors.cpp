#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>

std::string error_kind_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SchemaViolation: return "SchemaViolation";
        case ErrorKind::QuorumNotMet: return "QuorumNotMet";
        case ErrorKind::BundleLoad: return "BundleLoadError";
        case ErrorKind::DownstreamTimeout: return "DownstreamTimeout";
        case ErrorKind::Internal: return "InternalError";
    }
    return "InternalError";
}

SchemaViolation::SchemaViolation(std::vector<std::string> missing,
                                 std::vector<std::string> extra,
                                 std::vector<std::string> non_numeric,
                                 const std::string& detail)
    : EngineError(ErrorKind::SchemaViolation, describe(missing, extra, non_numeric, detail))
    , missing_(std::move(missing))
    , extra_(std::move(extra))
    , non_numeric_(std::move(non_numeric))
{}

std::string SchemaViolation::describe(const std::vector<std::string>& missing,
                                      const std::vector<std::string>& extra,
                                      const std::vector<std::string>& non_numeric,
                                      const std::string& detail) {
    std::string msg = "Schema violation";
    if (!detail.empty()) {
        msg += ": " + detail;
    }
    if (!missing.empty()) {
        msg += fmt::format("; missing [{}]", util::join(missing, ", "));
    }
    if (!extra.empty()) {
        msg += fmt::format("; extra [{}]", util::join(extra, ", "));
    }
    if (!non_numeric.empty()) {
        msg += fmt::format("; non-numeric [{}]", util::join(non_numeric, ", "));
    }
    return msg;
}

QuorumNotMet::QuorumNotMet(int succeeded, int required, std::vector<std::string> failed_models)
    : EngineError(ErrorKind::QuorumNotMet,
                  fmt::format("Quorum not met: {} of required {} base models succeeded (failed: {})",
                              succeeded, required, util::join(failed_models, ", ")))
    , succeeded_(succeeded)
    , required_(required)
    , failed_models_(std::move(failed_models))
{}

DownstreamTimeout::DownstreamTimeout(const std::string& stage, int budget_ms)
    : EngineError(ErrorKind::DownstreamTimeout,
                  fmt::format("Request exceeded {} ms budget during {}", budget_ms, stage))
    , stage_(stage)
    , budget_ms_(budget_ms)
{}

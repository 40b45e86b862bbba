#pragma once

#include <string>
#include <vector>
#include <stdexcept>

enum class ErrorKind {
    SchemaViolation,
    QuorumNotMet,
    BundleLoad,
    DownstreamTimeout,
    Internal
};

std::string error_kind_string(ErrorKind kind);

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Bad input: every offending field is listed, not just the first
class SchemaViolation : public EngineError {
public:
    SchemaViolation(std::vector<std::string> missing,
                    std::vector<std::string> extra,
                    std::vector<std::string> non_numeric,
                    const std::string& detail = "");

    const std::vector<std::string>& missing() const { return missing_; }
    const std::vector<std::string>& extra() const { return extra_; }
    const std::vector<std::string>& non_numeric() const { return non_numeric_; }

private:
    std::vector<std::string> missing_;
    std::vector<std::string> extra_;
    std::vector<std::string> non_numeric_;

    static std::string describe(const std::vector<std::string>& missing,
                                const std::vector<std::string>& extra,
                                const std::vector<std::string>& non_numeric,
                                const std::string& detail);
};

class QuorumNotMet : public EngineError {
public:
    QuorumNotMet(int succeeded, int required, std::vector<std::string> failed_models);

    int succeeded() const { return succeeded_; }
    int required() const { return required_; }
    const std::vector<std::string>& failed_models() const { return failed_models_; }

private:
    int succeeded_;
    int required_;
    std::vector<std::string> failed_models_;
};

class BundleLoadError : public EngineError {
public:
    explicit BundleLoadError(const std::string& message)
        : EngineError(ErrorKind::BundleLoad, message) {}
};

class DownstreamTimeout : public EngineError {
public:
    DownstreamTimeout(const std::string& stage, int budget_ms);

    const std::string& stage() const { return stage_; }
    int budget_ms() const { return budget_ms_; }

private:
    std::string stage_;
    int budget_ms_;
};

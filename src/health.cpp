#include "health.hpp"
#include "api_codec.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<const InferenceEngine> engine)
    : engine_(std::move(engine)), started_ms_(util::current_timestamp_ms()) {}

nlohmann::json HealthCheck::get_status() const {
    if (!engine_) {
        return {{"status", "unavailable"}, {"ts", util::current_iso8601()}};
    }
    
    nlohmann::json status = engine_->health();
    status["uptime_s"] = (util::current_timestamp_ms() - started_ms_) / 1000;
    status["ts"] = util::current_iso8601();
    return status;
}

bool HealthCheck::is_healthy() const {
    return engine_ && engine_->health().ready;
}

#include "api_server.hpp"
#include "api_codec.hpp"
#include <spdlog/spdlog.h>

ApiServer::ApiServer(const Config& config,
                     std::shared_ptr<const InferenceEngine> engine,
                     const HealthCheck& health,
                     std::shared_ptr<const PredictionTracker> tracker)
    : config_(config)
    , engine_(std::move(engine))
    , health_(health)
    , tracker_(std::move(tracker))
    , server_(std::make_unique<httplib::Server>())
{}

void ApiServer::start() {
    if (running_) return;
    
    setup_routes();
    running_ = true;
    
    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}", config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP server failed to listen on {}:{}",
                          config_.listen_addr, config_.listen_port);
            running_ = false;
        }
    });
    
    spdlog::info("API server started");
}

void ApiServer::stop() {
    if (server_thread_.joinable()) {
        server_->stop();
        server_thread_.join();
    }
    running_ = false;
    spdlog::info("API server stopped");
}

void ApiServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    server_->Get("/info", [this](const httplib::Request& req, httplib::Response& res) {
        handle_info(req, res);
    });
    server_->Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });
    server_->Post("/predict", [this](const httplib::Request& req, httplib::Response& res) {
        handle_predict(req, res);
    });
    server_->Post("/explain", [this](const httplib::Request& req, httplib::Response& res) {
        handle_explain(req, res);
    });
    server_->Post("/predict/batch", [this](const httplib::Request& req, httplib::Response& res) {
        handle_batch(req, res);
    });
}

void ApiServer::send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.set_content(body.dump(), "application/json");
    res.status = status;
}

template <typename F>
void ApiServer::guarded(const std::string& route, const httplib::Request& req,
                        httplib::Response& res, F fn) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("{}: malformed JSON: {}", route, e.what());
        send_json(res, 400, error_json(ErrorKind::SchemaViolation,
                                       std::string("malformed JSON: ") + e.what()));
        return;
    }
    
    try {
        send_json(res, 200, fn(body));
    } catch (const EngineError& e) {
        int status = http_status_for(e.kind());
        if (status >= 500) {
            spdlog::error("{} failed: {}", route, e.what());
        } else {
            spdlog::warn("{} rejected: {}", route, e.what());
        }
        send_json(res, status, error_json(e));
    } catch (const std::exception& e) {
        spdlog::error("{} internal error: {}", route, e.what());
        send_json(res, 500, error_json(ErrorKind::Internal, e.what()));
    }
}

void ApiServer::handle_health(const httplib::Request&, httplib::Response& res) {
    send_json(res, health_.is_healthy() ? 200 : 503, health_.get_status());
}

void ApiServer::handle_info(const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, engine_->info());
}

void ApiServer::handle_stats(const httplib::Request&, httplib::Response& res) {
    if (!tracker_) {
        send_json(res, 404, error_json(ErrorKind::Internal, "prediction tracking disabled"));
        return;
    }
    send_json(res, 200, tracker_->snapshot());
}

void ApiServer::handle_predict(const httplib::Request& req, httplib::Response& res) {
    guarded("/predict", req, res, [this](const nlohmann::json& body) {
        return nlohmann::json(engine_->predict(body));
    });
}

void ApiServer::handle_explain(const httplib::Request& req, httplib::Response& res) {
    guarded("/explain", req, res, [this](const nlohmann::json& body) {
        return nlohmann::json(engine_->explain(body));
    });
}

void ApiServer::handle_batch(const httplib::Request& req, httplib::Response& res) {
    guarded("/predict/batch", req, res, [this](const nlohmann::json& body) {
        auto items = engine_->predict_batch(batch_items(body));
        
        size_t ok = 0;
        for (const auto& item : items) {
            if (item.ok) ++ok;
        }
        spdlog::info("Batch of {} scored: {} ok, {} failed", items.size(), ok, items.size() - ok);
        return nlohmann::json(items);
    });
}

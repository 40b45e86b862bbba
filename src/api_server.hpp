#pragma once

#include "config.hpp"
#include "engine.hpp"
#include "health.hpp"
#include "prediction_tracker.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

class ApiServer {
public:
    ApiServer(const Config& config,
              std::shared_ptr<const InferenceEngine> engine,
              const HealthCheck& health,
              std::shared_ptr<const PredictionTracker> tracker);
    
    void start();
    void stop();
    bool is_running() const { return running_; }
    
private:
    const Config& config_;
    std::shared_ptr<const InferenceEngine> engine_;
    const HealthCheck& health_;
    std::shared_ptr<const PredictionTracker> tracker_;
    
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
    
    void setup_routes();
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_info(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_predict(const httplib::Request& req, httplib::Response& res);
    void handle_explain(const httplib::Request& req, httplib::Response& res);
    void handle_batch(const httplib::Request& req, httplib::Response& res);
    
    static void send_json(httplib::Response& res, int status, const nlohmann::json& body);
    
    // Parses the body and runs `fn`, mapping engine errors onto HTTP statuses
    template <typename F>
    void guarded(const std::string& route, const httplib::Request& req, httplib::Response& res, F fn);
};

// ─────────────────────────────────────────────────────────────────────────────
// stats_api.cpp  –  REST API Server for Swing Stats
// ─────────────────────────────────────────────────────────────────────────────

#include "stats_api.h"
#include "swing_json.h"

#include <httplib.h>

#include <iostream>

namespace swing {

StatsApi::StatsApi(SwingDetector& detector, uint16_t port)
    : detector_(detector), port_(port), server_(std::make_unique<httplib::Server>()) {
    register_routes();
}

StatsApi::~StatsApi() {
    stop();
}

bool StatsApi::start() {
    if (running_.exchange(true)) return true;

    if (!server_->bind_to_port("0.0.0.0", port_)) {
        std::cerr << "[StatsApi] Cannot bind port " << port_ << "\n";
        running_ = false;
        return false;
    }
    thread_ = std::thread(&StatsApi::run, this);
    // stop() only interrupts a running accept loop
    server_->wait_until_ready();
    std::cout << "[StatsApi] HTTP server listening on port " << port_ << "\n";
    return true;
}

void StatsApi::stop() {
    if (!running_.exchange(false)) return;
    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void StatsApi::register_routes() {
    httplib::Server& svr = *server_;

    svr.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"}
    });

    svr.Get("/api/swing/current", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(live_json(detector_.snapshot()), "application/json");
    });

    svr.Get("/api/swing/last", [this](const httplib::Request&, httplib::Response& res) {
        auto snap = detector_.snapshot();
        if (!snap.last_swing) {
            res.status = 404;
            res.set_content("{\"error\":\"no completed swing\"}", "application/json");
            return;
        }
        res.set_content(analytics_json(*snap.last_swing), "application/json");
    });

    svr.Get("/api/session", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(session_json(detector_.snapshot().session), "application/json");
    });

    svr.Post("/api/control/practice", [this](const httplib::Request& req, httplib::Response& res) {
        std::string v = req.get_param_value("enabled");
        if (v != "0" && v != "1") {
            res.status = 400;
            res.set_content("{\"error\":\"enabled must be 0 or 1\"}", "application/json");
            return;
        }
        detector_.set_practice_mode(v == "1");
        res.set_content(live_json(detector_.snapshot()), "application/json");
    });

    svr.Post("/api/control/reset", [this](const httplib::Request&, httplib::Response& res) {
        detector_.reset();
        res.set_content(live_json(detector_.snapshot()), "application/json");
    });

    svr.Post("/api/control/force-complete", [this](const httplib::Request&, httplib::Response& res) {
        bool produced = detector_.force_complete();
        res.set_content(produced ? "{\"completed\":true}" : "{\"completed\":false}",
                        "application/json");
    });

    svr.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("", "text/plain");
    });
}

void StatsApi::run() {
    if (!server_->listen_after_bind() && running_) {
        std::cerr << "[StatsApi] Listener on port " << port_ << " stopped unexpectedly\n";
    }
}

}  // namespace swing

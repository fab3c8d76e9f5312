#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// stats_api.h  –  REST API for Swing Stats
//
// Exposes the detector's published state over HTTP so a watch companion,
// dashboard or coaching tool can follow the session.  Runs on its own
// thread and only reads through SwingDetector::snapshot(); the control
// endpoints go through the detector's locked entry points.
//
// Endpoints:
//   GET  /api/swing/current            – phase, in-progress flag, live readouts
//   GET  /api/swing/last               – last finalized swing (404 if none)
//   GET  /api/session                  – session summary
//   POST /api/control/practice?enabled=0|1
//   POST /api/control/reset
//   POST /api/control/force-complete
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_detector.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

namespace httplib {
class Server;
}

namespace swing {

class StatsApi {
public:
    explicit StatsApi(SwingDetector& detector, uint16_t port = 8080);
    ~StatsApi();

    StatsApi(const StatsApi&) = delete;
    StatsApi& operator=(const StatsApi&) = delete;

    /// Bind and start serving.  Returns false when the port is unavailable.
    bool start();
    void stop();

private:
    SwingDetector& detector_;
    uint16_t port_;
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    void register_routes();
    void run();
};

}  // namespace swing

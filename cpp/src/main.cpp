// ─────────────────────────────────────────────────────────────────────────────
// main.cpp  –  Swing Engine: Wrist IMU Swing Detection Pipeline
//
// Brings together all components:
//   1. Load configuration (defaults → config file → flags)
//   2. Open the motion sample source
//   3. Run the swing detector on every sample
//   4. Send events and live state as UDP telemetry
//   5. Expose stats via REST API
//   6. Optional OpenCV trace preview
// ─────────────────────────────────────────────────────────────────────────────

#include "config.h"
#include "sample_source.h"
#include "stats_api.h"
#include "swing_detector.h"
#include "telemetry_sender.h"
#include "trace_view.h"

#include <opencv2/highgui.hpp>

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <string>

// Live-state datagram every N samples (≈10 Hz at 100 Hz input)
static constexpr int kLiveEvery = 10;

static void print_usage(const char* prog) {
    std::cout
        << "Usage: " << prog << " [OPTIONS]\n"
        << "\n"
        << "Optional:\n"
        << "  --config PATH        Config file (YAML / JSON / XML)\n"
        << "  --source SRC         '-' for CSV on stdin, a .csv file, or a\n"
        << "                       FileStorage recording (default: -)\n"
        << "  --sensitivity S      Detection sensitivity 0.5-1.5 (default: 1.0)\n"
        << "  --host HOST          Telemetry UDP host (default: 127.0.0.1)\n"
        << "  --port PORT          Telemetry UDP port (default: 7001)\n"
        << "  --api-port PORT      REST API port for stats (default: 8080)\n"
        << "  --no-api             Do not start the REST API\n"
        << "  --realtime           Replay at recorded sample spacing\n"
        << "  --practice           Start in practice mode\n"
        << "  --gui                Show OpenCV trace preview\n"
        << "  --quiet              Do not log phase changes\n"
        << "  -h, --help           Show this help\n";
}

static uint16_t parse_port(const std::string& v, const char* prog) {
    int p = 0;
    try {
        p = std::stoi(v);
    } catch (const std::exception&) {
        p = 0;
    }
    if (p <= 0 || p > 65535) {
        std::cerr << "Invalid port: " << v << "\n";
        print_usage(prog);
        std::exit(1);
    }
    return static_cast<uint16_t>(p);
}

static swing::AppConfig parse_args(int argc, char** argv, bool& with_api) {
    swing::AppConfig cfg;
    with_api = true;

    // Config file first so flags override it
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (!swing::load_config_file(argv[i + 1], cfg)) std::exit(1);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config") && i + 1 < argc) {
            ++i;
        } else if ((arg == "--source") && i + 1 < argc) {
            cfg.source = argv[++i];
        } else if ((arg == "--sensitivity") && i + 1 < argc) {
            try {
                cfg.detector.sensitivity = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid sensitivity: " << argv[i] << "\n";
                std::exit(1);
            }
        } else if ((arg == "--host") && i + 1 < argc) {
            cfg.telemetry_host = argv[++i];
        } else if ((arg == "--port") && i + 1 < argc) {
            cfg.telemetry_port = parse_port(argv[++i], argv[0]);
        } else if ((arg == "--api-port") && i + 1 < argc) {
            cfg.api_port = parse_port(argv[++i], argv[0]);
        } else if (arg == "--no-api") {
            with_api = false;
        } else if (arg == "--realtime") {
            cfg.realtime = true;
        } else if (arg == "--practice") {
            cfg.practice_mode = true;
        } else if (arg == "--gui") {
            cfg.show_gui = true;
        } else if (arg == "--quiet") {
            cfg.detector.log_events = false;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return cfg;
}

int main(int argc, char** argv) {
    bool with_api = true;
    swing::AppConfig cfg = parse_args(argc, argv, with_api);

    // ── 1. Open Sample Source ───────────────────────────────────────────
    swing::SampleSource source;
    if (!source.open(cfg.source)) {
        return 1;
    }
    source.set_realtime(cfg.realtime);

    // ── 2. Init UDP Telemetry ───────────────────────────────────────────
    swing::TelemetrySender telemetry;
    if (!telemetry.init(cfg.telemetry_host, cfg.telemetry_port)) {
        std::cerr << "[WARN] Telemetry init failed – running without UDP link\n";
    }

    // ── 3. Init Detector ────────────────────────────────────────────────
    swing::SwingDetector detector(cfg.detector);
    if (cfg.practice_mode) {
        detector.set_practice_mode(true);
    }

    // Handler also runs on the API thread for control requests
    std::atomic<int> swings{0};
    detector.set_event_handler([&](const swing::SwingEvent& ev) {
        if (std::holds_alternative<swing::SwingCompleted>(ev)) swings++;
        if (telemetry.is_open()) telemetry.send_event(ev);
    });

    // ── 4. Start REST API ───────────────────────────────────────────────
    swing::StatsApi api(detector, cfg.api_port);
    if (with_api && !api.start()) {
        std::cerr << "[WARN] REST API unavailable\n";
    }

    // ── 5. Main Loop ────────────────────────────────────────────────────
    swing::TraceView view(cfg.detector.buffer_capacity);
    cv::Mat canvas;

    swing::MotionSample sample;
    int sample_count = 0;
    int rejected = 0;

    std::cout << "[Main] Processing samples"
              << (cfg.show_gui ? " (press 'q' to quit)" : "") << "\n";

    while (source.read(sample)) {
        if (!detector.process(sample)) {
            rejected++;
            continue;
        }
        sample_count++;

        if (telemetry.is_open() && sample_count % kLiveEvery == 0) {
            telemetry.send_live(detector.snapshot());
        }

        if (cfg.show_gui) {
            auto snap = detector.snapshot();
            view.push(sample, snap.phase);
            view.render(canvas, snap);
            cv::imshow("Swing Engine – Motion Trace", canvas);
            if (cv::waitKey(1) == 'q') break;
        }
    }

    auto summary = detector.snapshot().session;
    std::cout << "[Main] Processed " << sample_count << " samples ("
              << rejected << " rejected), " << swings.load() << " swings, "
              << "avg tempo " << summary.average_tempo << ", "
              << "consistency " << summary.consistency_score << "\n";

    api.stop();
    telemetry.close();
    return 0;
}
